#include "veil/redaction_dispatcher.hpp"
#include <algorithm>
#include <utility>

namespace veil
{

    namespace
    {
        std::string describe_classes(const std::vector<ClassId> &classes)
        {
            std::string out = "[";
            for (std::size_t i = 0; i < classes.size(); ++i)
            {
                if (i > 0)
                    out += ", ";
                out += classes[i].to_string();
            }
            out += "]";
            return out;
        }
    } // namespace

    RedactionDispatcher::RedactionDispatcher(std::unordered_map<ClassId, RedactorPtr, ClassIdHash> redactors,
                                             RedactorPtr fallback)
        : redactors_(std::move(redactors)), fallback_(std::move(fallback))
    {
    }

    const Redactor &RedactionDispatcher::resolve(const ClassId &class_id) const
    {
        auto it = redactors_.find(class_id);
        if (it != redactors_.end())
        {
            return *it->second;
        }
        return *fallback_;
    }

    void RedactionDispatcher::redact_as(const ClassId &class_id, std::string_view value, const RedactionOutput &output) const
    {
        resolve(class_id).redact(class_id, value, output);
    }

    std::string RedactionDispatcher::redacted_as(const ClassId &class_id, std::string_view value) const
    {
        const auto &redactor = resolve(class_id);
        std::string out;
        if (auto len = redactor.exact_len(class_id))
        {
            out.reserve(*len);
        }
        redactor.redact(class_id, value, [&out](std::string_view chunk) { out.append(chunk); });
        return out;
    }

    std::optional<std::size_t> RedactionDispatcher::exact_len(const ClassId &class_id) const
    {
        return resolve(class_id).exact_len(class_id);
    }

    bool RedactionDispatcher::has_class_redactor(const ClassId &class_id) const
    {
        return redactors_.contains(class_id);
    }

    std::vector<ClassId> RedactionDispatcher::registered_classes() const
    {
        std::vector<ClassId> classes;
        classes.reserve(redactors_.size());
        for (const auto &[class_id, redactor] : redactors_)
        {
            classes.push_back(class_id);
        }
        std::sort(classes.begin(), classes.end());
        return classes;
    }

    std::string RedactionDispatcher::describe() const
    {
        return describe_classes(registered_classes());
    }

} // namespace veil
