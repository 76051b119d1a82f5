#include "PlatformConfig.hpp"

namespace iotagent {

const Tag* Tag::child(const std::string& childName) const {
    for (const auto& tag : children) {
        if (tag.name == childName) {
            return &tag;
        }
    }
    return nullptr;
}

const Tag* Tag::find(const std::string& path) const {
    const Tag* current = this;
    std::size_t start = 0;

    while (current && start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            current = current->child(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return current;
}

} // namespace iotagent
