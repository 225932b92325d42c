#include "render/Renderer.h"
#include "render/TextRenderer.h"
#include "render/JsonRenderer.h"
#include "core/Errors.h"
#include "utils/TextUtils.h"

std::string Renderer::noCommitsSentence(const std::string& ancestor) {
    return "No commits found between " + ancestor + " and HEAD.";
}

std::string Renderer::oldPathLabel(const ChangedFile& file) {
    return (file.oldPath && !file.oldPath->empty()) ? *file.oldPath : "New Addition";
}

std::string Renderer::newPathLabel(const ChangedFile& file) {
    return (file.newPath && !file.newPath->empty()) ? *file.newPath : "Deleted";
}

void Renderer::requireUtf8(const ChangedFile& file) {
    size_t bad = UTF8Utils::findInvalid(file.patchText);
    if (bad != std::string::npos) {
        throw EncodingError("Patch for " + oldPathLabel(file) + " -> " + newPathLabel(file) +
                            " is not valid UTF-8 (byte offset " + std::to_string(bad) + ")");
    }
}

std::unique_ptr<Renderer> makeRenderer(OutputFormat format) {
    if (format == OutputFormat::Json) {
        return std::make_unique<JsonRenderer>();
    }
    return std::make_unique<TextRenderer>();
}
