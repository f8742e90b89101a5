#include "ResultPreparation.hpp"
#include "../processing/MarkdownCleanup.hpp"

#include <plog/Log.h>

namespace
{
constexpr const char* kMarkdownField = "md_content";
constexpr const char* kDocumentField = "document";
} // namespace

ResultPreparation::ResultPreparation(const CleanupSettings& settings)
    : enabled_(settings.enabled)
    , options_(settings.toOptions())
{
}

nlohmann::json* ResultPreparation::findMarkdownHolder(nlohmann::json& result) const
{
    if (!result.is_object())
        return nullptr;

    auto doc = result.find(kDocumentField);
    if (doc != result.end() && doc->is_object())
        return &*doc;

    return &result;
}

bool ResultPreparation::prepareDocument(nlohmann::json& result) const
{
    if (!enabled_)
        return false;

    nlohmann::json* holder = findMarkdownHolder(result);
    if (!holder)
    {
        PLOG_WARNING << "Conversion result is not a JSON object; left untouched";
        return false;
    }

    auto md = holder->find(kMarkdownField);
    if (md == holder->end() || !md->is_string())
        return false;

    const auto& original = md->get_ref<const std::string&>();
    if (original.empty())
        return false;

    std::string cleaned = processing::cleanup_markdown(original, options_);
    if (cleaned == original)
    {
        PLOG_DEBUG << "Markdown cleanup made no changes";
        return false;
    }

    PLOG_DEBUG << "Markdown cleanup: " << original.size() << " -> " << cleaned.size() << " bytes";
    *md = std::move(cleaned);
    return true;
}
