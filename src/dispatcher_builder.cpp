#include "veil/dispatcher_builder.hpp"
#include "veil/simple_redactor.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace veil
{

    namespace
    {
        std::shared_ptr<const Redactor> make_erasing_redactor()
        {
            return std::make_shared<SimpleRedactor>(SimpleRedactor::erase());
        }
    } // namespace

    DispatcherBuilder::DispatcherBuilder() : fallback_(make_erasing_redactor()) {}

    DispatcherBuilder &DispatcherBuilder::add_class_redactor(ClassId class_id, RedactorPtr redactor)
    {
        if (!redactor)
        {
            redactor = make_erasing_redactor();
        }
        redactors_.insert_or_assign(std::move(class_id), std::move(redactor));
        return *this;
    }

    DispatcherBuilder &DispatcherBuilder::set_fallback_redactor(RedactorPtr redactor)
    {
        fallback_ = redactor ? std::move(redactor) : make_erasing_redactor();
        return *this;
    }

    RedactionDispatcher DispatcherBuilder::build() const
    {
        spdlog::debug("Building redaction dispatcher with {} class redactor(s)", redactors_.size());
        return RedactionDispatcher(redactors_, fallback_);
    }

    std::string DispatcherBuilder::describe() const
    {
        return RedactionDispatcher(redactors_, fallback_).describe();
    }

} // namespace veil
