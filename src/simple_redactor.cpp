#include "veil/simple_redactor.hpp"

namespace veil
{

    namespace
    {
        constexpr std::string_view ASTERISKS = "********************************";

        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };

        // "<taxonomy.class:" + body + ">"
        std::string tag(const ClassId &class_id, std::string_view body)
        {
            std::string out;
            out.reserve(class_id.display_len() + body.size() + 3);
            out.push_back('<');
            out.append(class_id.taxonomy());
            out.push_back('.');
            out.append(class_id.name());
            out.push_back(':');
            out.append(body);
            out.push_back('>');
            return out;
        }

        std::size_t tag_overhead(const ClassId &class_id)
        {
            return class_id.display_len() + 3;
        }
    } // namespace

    std::string mode_name(const SimpleRedactorMode &mode)
    {
        return std::visit(overloaded{
                              [](const redaction_mode::Erase &m) { return std::string(m.tagged ? "erase_and_tag" : "erase"); },
                              [](const redaction_mode::Passthrough &m) { return std::string(m.tagged ? "passthrough_and_tag" : "passthrough"); },
                              [](const redaction_mode::Replace &m) { return std::string(m.tagged ? "replace_and_tag" : "replace"); },
                              [](const redaction_mode::Insert &m) { return std::string(m.tagged ? "insert_and_tag" : "insert"); },
                          },
                          mode);
    }

    SimpleRedactor::SimpleRedactor() : mode_(redaction_mode::Replace{'*'}) {}

    SimpleRedactor::SimpleRedactor(SimpleRedactorMode mode) : mode_(std::move(mode)) {}

    void SimpleRedactor::redact(const ClassId &class_id, std::string_view value, const RedactionOutput &output) const
    {
        std::visit(overloaded{
                       [&](const redaction_mode::Erase &m) {
                           if (m.tagged)
                           {
                               output(tag(class_id, {}));
                           }
                       },
                       [&](const redaction_mode::Passthrough &m) {
                           if (m.tagged)
                           {
                               output(tag(class_id, value));
                           }
                           else
                           {
                               output(value);
                           }
                       },
                       [&](const redaction_mode::Replace &m) {
                           const auto len = value.size();
                           if (m.ch == '*' && len <= ASTERISKS.size())
                           {
                               auto run = ASTERISKS.substr(0, len);
                               if (m.tagged)
                               {
                                   output(tag(class_id, run));
                               }
                               else
                               {
                                   output(run);
                               }
                               return;
                           }
                           std::string run(len, m.ch);
                           if (m.tagged)
                           {
                               output(tag(class_id, run));
                           }
                           else
                           {
                               output(run);
                           }
                       },
                       [&](const redaction_mode::Insert &m) {
                           if (m.tagged)
                           {
                               output(tag(class_id, m.text));
                           }
                           else
                           {
                               output(m.text);
                           }
                       },
                   },
                   mode_);
    }

    std::optional<std::size_t> SimpleRedactor::exact_len(const ClassId &class_id) const
    {
        return std::visit(overloaded{
                              [&](const redaction_mode::Erase &m) -> std::optional<std::size_t> {
                                  return m.tagged ? tag_overhead(class_id) : 0;
                              },
                              [](const redaction_mode::Passthrough &) -> std::optional<std::size_t> {
                                  return std::nullopt;
                              },
                              [](const redaction_mode::Replace &) -> std::optional<std::size_t> {
                                  return std::nullopt;
                              },
                              [&](const redaction_mode::Insert &m) -> std::optional<std::size_t> {
                                  return m.tagged ? tag_overhead(class_id) + m.text.size() : m.text.size();
                              },
                          },
                          mode_);
    }

} // namespace veil
