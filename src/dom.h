#pragma once

#include "types.h"

#include <memory>
#include <initializer_list>
#include <utility>

namespace vellum
{
    // Retained SVG node, the vector backend's scene graph.
    // Attribute and style order is insertion order, which keeps the serialized
    // markup stable across identical draw sequences.
    struct SvgElement : public std::enable_shared_from_this<SvgElement>
    {
        using AttributeList = std::vector<std::pair<std::string, std::string>>;

        std::string name;
        AttributeList attributes;
        AttributeList styles;
        std::vector<std::shared_ptr<SvgElement>> children;
        std::weak_ptr<SvgElement> parent;

        static std::shared_ptr<SvgElement> Create(std::string_view name,
            std::initializer_list<std::pair<std::string_view, std::string_view>> attrs = {});

        SvgElement& SetAttribute(std::string_view key, std::string_view value);
        SvgElement& SetAttribute(std::string_view key, float value);
        SvgElement& SetAttributes(std::initializer_list<std::pair<std::string_view, std::string_view>> attrs);
        SvgElement& RemoveAttributes(std::initializer_list<std::string_view> keys);
        [[nodiscard]] std::optional<std::string_view> Attribute(std::string_view key) const;

        // Inline "style" attribute, e.g. SetStyle("position", "absolute")
        SvgElement& SetStyle(std::string_view property, std::string_view value);
        [[nodiscard]] std::optional<std::string_view> Style(std::string_view property) const;

        // Appends as the last child (topmost in paint order), detaching it from any previous parent
        SvgElement& AppendChild(const std::shared_ptr<SvgElement>& child);
        // Detaches this node from its parent, returns false if it had none
        bool Remove();
        void Empty();
        [[nodiscard]] int ChildCount() const { return (int)children.size(); }

        void Hide();
        void Show();
        [[nodiscard]] bool IsVisible() const;
        void SetOpacity(float opacity);

        [[nodiscard]] std::string Serialize() const;
        void Serialize(std::string& out, int depth) const;
    };
}
