#include "notes_store.hpp"
#include <algorithm>
#include <stdexcept>

namespace notehook {

void NotesStore::validate_name(const std::string& name) {
    if (name.empty()) throw std::invalid_argument("note name is empty");
    if (name == "." || name == "..") throw std::invalid_argument("invalid note name: " + name);
    if (name == STAGING_DIR) throw std::invalid_argument("reserved note name: " + name);
    if (name.find_first_of("/\\") != std::string::npos || name.find('\0') != std::string::npos) {
        throw std::invalid_argument("note name must not contain a path separator: " + name);
    }
}

fs::path NotesStore::path_for(const std::string& name) const {
    validate_name(name);
    return fs::path(notes_dir_) / name;
}

std::vector<std::string> NotesStore::list() const {
    std::vector<std::string> names;
    if (!fs::is_directory(notes_dir_)) return names;

    for (auto& entry : fs::directory_iterator(notes_dir_)) {
        if (!entry.is_regular_file()) continue;
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<std::string> NotesStore::read(const std::string& name) const {
    auto path = path_for(name);
    if (!fs::exists(path)) return std::nullopt;
    if (!fs::is_regular_file(path)) {
        throw std::runtime_error("not a regular file: " + path.string());
    }
    auto content = read_file(path.string());
    if (!content) throw std::runtime_error("cannot read note: " + path.string());
    return content;
}

void NotesStore::write(const std::string& name, const std::string& content) {
    auto path = path_for(name);
    auto staging = fs::path(notes_dir_) / STAGING_DIR;
    fs::create_directories(staging);

    // Temp files live under the staging subdirectory, which list() skips
    auto tmp = staging / (name + ".tmp");
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot write note: " + path.string());
        f << content;
        f.flush();
        if (!f) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("short write on note: " + path.string());
        }
    }
    fs::rename(tmp, path);
}

bool NotesStore::remove(const std::string& name) {
    auto path = path_for(name);
    if (!fs::exists(path)) return false;
    if (!fs::is_regular_file(path)) {
        throw std::runtime_error("not a regular file: " + path.string());
    }
    fs::remove(path);
    return true;
}

} // namespace notehook
