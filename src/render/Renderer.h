#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "git/GitTypes.h"

/**
 * @brief Turns change sets and histories into one document format.
 *
 * One instance is created at startup for the configured OutputFormat and
 * shared by all requests. Implementations are stateless and never touch the
 * repository.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual OutputFormat format() const = 0;

    // Phrase used in framing sentences: "plain text" / "the JSON format".
    virtual std::string formatName() const = 0;

    /**
     * @throws EncodingError when a patch is not valid UTF-8
     */
    virtual std::string renderChanges(const std::vector<ChangedFile>& changes) const = 0;

    /**
     * @brief Standalone history document (the git-commit-messages prompt).
     *
     * An empty history renders as an explicit "No commits found" statement.
     */
    virtual std::string renderHistory(const std::vector<CommitRecord>& commits, const std::string& ancestor) const = 0;

    /**
     * @brief History followed by diff in one document.
     * @param commits nullptr omits the history part entirely
     */
    virtual std::string renderComposite(const std::vector<CommitRecord>* commits, const std::string& ancestor,
                                        const std::vector<ChangedFile>& changes) const = 0;

    static std::string noCommitsSentence(const std::string& ancestor);

    // Header substitutions for absent paths.
    static std::string oldPathLabel(const ChangedFile& file);
    static std::string newPathLabel(const ChangedFile& file);

protected:
    static void requireUtf8(const ChangedFile& file);
};

std::unique_ptr<Renderer> makeRenderer(OutputFormat format);
