#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace veil
{

    /**
     * Identity of a data class: the name of a taxonomy plus the name of a
     * class within it. Ordering is lexicographic by taxonomy, then class.
     */
    class ClassId
    {
    public:
        ClassId(std::string taxonomy, std::string name);

        const std::string &taxonomy() const { return taxonomy_; }
        const std::string &name() const { return name_; }

        /** Rendered as "taxonomy.class". */
        std::string to_string() const;

        /** Length of to_string() without building it. */
        std::size_t display_len() const { return taxonomy_.size() + 1 + name_.size(); }

        bool operator==(const ClassId &other) const = default;
        std::strong_ordering operator<=>(const ClassId &other) const = default;

    private:
        std::string taxonomy_;
        std::string name_;
    };

    /**
     * Parse "taxonomy.class". The split happens at the first '.', so class
     * names may themselves contain dots. Empty on a missing separator or an
     * empty part.
     */
    std::optional<ClassId> parse_class_id(std::string_view text);

    struct ClassIdHash
    {
        std::size_t operator()(const ClassId &id) const noexcept;
    };

} // namespace veil

template <>
struct std::hash<veil::ClassId>
{
    std::size_t operator()(const veil::ClassId &id) const noexcept
    {
        return veil::ClassIdHash{}(id);
    }
};
