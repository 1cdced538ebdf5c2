#ifndef KGVIZ_GRAPH_TYPE_STYLES_HPP
#define KGVIZ_GRAPH_TYPE_STYLES_HPP

#include <map>
#include <string>

namespace kgviz {

// Presentation attributes of one semantic node type
struct TypeStyle {
    std::string color = "#6b7280";   // Fill color, #rrggbb
    std::string label;               // Display name (empty = type key)
    float default_size = 1.0f;       // Size used when the payload omits one
};

// Mapping from type key to presentation. Injected into the session so
// new entity types need no engine change; unknown keys get a neutral
// fallback style labelled with the raw key.
class TypeStyles {
public:
    TypeStyles() = default;

    // The entity types produced by the paper analysis backend
    static TypeStyles defaults();

    void set(const std::string& type, const TypeStyle& style);
    bool has(const std::string& type) const;

    // Style for a type, falling back for unknown keys
    TypeStyle style(const std::string& type) const;

    const std::string& color(const std::string& type) const;
    std::string display_label(const std::string& type) const;

    const std::map<std::string, TypeStyle>& entries() const { return styles_; }

    TypeStyle& fallback() { return fallback_; }
    const TypeStyle& fallback() const { return fallback_; }

private:
    std::map<std::string, TypeStyle> styles_;
    TypeStyle fallback_;
};

}  // namespace kgviz

#endif // KGVIZ_GRAPH_TYPE_STYLES_HPP
