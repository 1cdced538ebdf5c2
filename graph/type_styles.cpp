#include "type_styles.hpp"

namespace kgviz {

TypeStyles TypeStyles::defaults() {
    TypeStyles styles;
    styles.set("research_problem", {"#ef4444", "Research Problem", 3.0f});
    styles.set("method",           {"#3b82f6", "Method", 2.5f});
    styles.set("dataset",          {"#22c55e", "Dataset", 2.0f});
    styles.set("metric",           {"#f59e0b", "Metric", 1.5f});
    styles.set("innovation",       {"#8b5cf6", "Innovation", 2.5f});
    styles.set("baseline",         {"#6b7280", "Baseline", 1.5f});
    styles.set("tool",             {"#06b6d4", "Tool", 1.0f});
    styles.set("theory",           {"#ec4899", "Theory", 2.0f});
    return styles;
}

void TypeStyles::set(const std::string& type, const TypeStyle& style) {
    styles_[type] = style;
}

bool TypeStyles::has(const std::string& type) const {
    return styles_.find(type) != styles_.end();
}

TypeStyle TypeStyles::style(const std::string& type) const {
    auto it = styles_.find(type);
    if (it != styles_.end()) {
        return it->second;
    }
    TypeStyle result = fallback_;
    result.label = type;
    return result;
}

const std::string& TypeStyles::color(const std::string& type) const {
    auto it = styles_.find(type);
    return it != styles_.end() ? it->second.color : fallback_.color;
}

std::string TypeStyles::display_label(const std::string& type) const {
    auto it = styles_.find(type);
    if (it == styles_.end() || it->second.label.empty()) {
        return type;
    }
    return it->second.label;
}

}  // namespace kgviz
