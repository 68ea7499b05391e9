#pragma once
#include "utils.hpp"
#include <string>
#include <vector>
#include <optional>

namespace notehook {

// Flat directory of notes, one file per note, filename = note name.
// The host serializes invocations, so there is no locking.
class NotesStore {
public:
    explicit NotesStore(std::string notes_dir)
        : notes_dir_(std::move(notes_dir))
    {}

    // Sorted note names; empty if the directory does not exist (never creates it)
    std::vector<std::string> list() const;

    // nullopt if the note does not exist
    std::optional<std::string> read(const std::string& name) const;

    // Creates the directory if needed, then creates or replaces the note
    // through a temp file + rename so readers never see a partial write.
    void write(const std::string& name, const std::string& content);

    // false if the note does not exist; throws if the name is not a regular file
    bool remove(const std::string& name);

    // Subdirectory holding in-flight writes; never a valid note name
    static constexpr const char* STAGING_DIR = ".staging";

    // Throws std::invalid_argument unless `name` is a plain file name
    static void validate_name(const std::string& name);

private:
    std::string notes_dir_;

    fs::path path_for(const std::string& name) const;
};

} // namespace notehook
