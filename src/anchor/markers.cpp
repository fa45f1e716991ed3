#include "anchor/markers.hpp"

#include <algorithm>
#include <cctype>

namespace vcm::anchor {

CommentMarkerTable::CommentMarkerTable() : fallback_{"#", "//", "--", "%", ";"} {}

void CommentMarkerTable::assign(std::initializer_list<const char*> types,
                                const MarkerList& markers) {
    for (const char* type : types) {
        table_[type] = markers;
    }
}

const CommentMarkerTable& CommentMarkerTable::builtin() {
    static const CommentMarkerTable table = [] {
        CommentMarkerTable t;
        t.assign({"py", "python", "pyx", "pyi", "sh", "bash", "rb", "toml", "yaml", "yml"},
                 {"#"});
        t.assign({"js", "jsx", "ts", "tsx", "java", "c", "cpp", "cc", "cxx", "h", "hpp", "cs",
                  "go", "rs", "swift", "kt"},
                 {"//"});
        t.assign({"sql", "lua"}, {"--"});
        t.assign({"m", "matlab"}, {"%"});
        t.assign({"asm", "s"}, {";"});
        return t;
    }();
    return table;
}

const MarkerList& CommentMarkerTable::markers_for(std::string_view file_type) const {
    auto it = table_.find(std::string(file_type));
    return it != table_.end() ? it->second : fallback_;
}

bool CommentMarkerTable::knows(std::string_view file_type) const {
    return table_.find(std::string(file_type)) != table_.end();
}

CommentMarkerTable
CommentMarkerTable::with_overrides(const std::map<std::string, MarkerList>& overrides) const {
    CommentMarkerTable copy = *this;
    for (const auto& [type, markers] : overrides) {
        if (!markers.empty()) {
            copy.table_[type] = markers;
        }
    }
    return copy;
}

std::string file_type_for_path(std::string_view path) {
    size_t slash = path.find_last_of("/\\");
    std::string_view name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    size_t dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return {};
    }
    std::string ext(name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace vcm::anchor
