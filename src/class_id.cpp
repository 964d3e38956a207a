#include "veil/class_id.hpp"
#include <utility>

namespace veil
{

    ClassId::ClassId(std::string taxonomy, std::string name)
        : taxonomy_(std::move(taxonomy)), name_(std::move(name))
    {
    }

    std::string ClassId::to_string() const
    {
        std::string out;
        out.reserve(display_len());
        out.append(taxonomy_);
        out.push_back('.');
        out.append(name_);
        return out;
    }

    std::optional<ClassId> parse_class_id(std::string_view text)
    {
        auto dot = text.find('.');
        if (dot == std::string_view::npos || dot == 0 || dot + 1 == text.size())
        {
            return std::nullopt;
        }
        return ClassId(std::string(text.substr(0, dot)), std::string(text.substr(dot + 1)));
    }

    std::size_t ClassIdHash::operator()(const ClassId &id) const noexcept
    {
        // boost::hash_combine mixing
        std::size_t seed = std::hash<std::string>{}(id.taxonomy());
        seed ^= std::hash<std::string>{}(id.name()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }

} // namespace veil
