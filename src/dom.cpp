#include "dom.h"

#include <algorithm>

namespace vellum
{
    static void SetEntry(SvgElement::AttributeList& list, std::string_view key, std::string_view value)
    {
        auto it = std::find_if(list.begin(), list.end(), [key](const auto& entry) { return entry.first == key; });
        if (it != list.end()) it->second = std::string{ value };
        else list.emplace_back(std::string{ key }, std::string{ value });
    }

    static std::optional<std::string_view> GetEntry(const SvgElement::AttributeList& list, std::string_view key)
    {
        auto it = std::find_if(list.begin(), list.end(), [key](const auto& entry) { return entry.first == key; });
        return it != list.end() ? std::optional<std::string_view>{ it->second } : std::nullopt;
    }

    static void AppendEscaped(std::string& out, std::string_view text)
    {
        for (auto ch : text)
        {
            switch (ch)
            {
            case '&': out.append("&amp;"); break;
            case '<': out.append("&lt;"); break;
            case '>': out.append("&gt;"); break;
            case '"': out.append("&quot;"); break;
            default: out.push_back(ch); break;
            }
        }
    }

    std::shared_ptr<SvgElement> SvgElement::Create(std::string_view name,
        std::initializer_list<std::pair<std::string_view, std::string_view>> attrs)
    {
        auto element = std::make_shared<SvgElement>();
        element->name = std::string{ name };
        element->SetAttributes(attrs);
        return element;
    }

    SvgElement& SvgElement::SetAttribute(std::string_view key, std::string_view value)
    {
        SetEntry(attributes, key, value);
        return *this;
    }

    SvgElement& SvgElement::SetAttribute(std::string_view key, float value)
    {
        return SetAttribute(key, std::string_view{ ToString(value) });
    }

    SvgElement& SvgElement::SetAttributes(std::initializer_list<std::pair<std::string_view, std::string_view>> attrs)
    {
        for (const auto& [key, value] : attrs)
            SetEntry(attributes, key, value);
        return *this;
    }

    SvgElement& SvgElement::RemoveAttributes(std::initializer_list<std::string_view> keys)
    {
        for (auto key : keys)
        {
            attributes.erase(std::remove_if(attributes.begin(), attributes.end(),
                [key](const auto& entry) { return entry.first == key; }), attributes.end());
        }

        return *this;
    }

    std::optional<std::string_view> SvgElement::Attribute(std::string_view key) const
    {
        return GetEntry(attributes, key);
    }

    SvgElement& SvgElement::SetStyle(std::string_view property, std::string_view value)
    {
        SetEntry(styles, property, value);
        return *this;
    }

    std::optional<std::string_view> SvgElement::Style(std::string_view property) const
    {
        return GetEntry(styles, property);
    }

    SvgElement& SvgElement::AppendChild(const std::shared_ptr<SvgElement>& child)
    {
        if (!child || child.get() == this) return *this;

        child->Remove();
        child->parent = weak_from_this();
        children.push_back(child);
        return *this;
    }

    bool SvgElement::Remove()
    {
        auto owner = parent.lock();
        if (!owner) return false;

        auto self = shared_from_this();
        auto& siblings = owner->children;
        siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
            [this](const auto& child) { return child.get() == this; }), siblings.end());
        parent.reset();
        return true;
    }

    void SvgElement::Empty()
    {
        for (auto& child : children)
            child->parent.reset();
        children.clear();
    }

    void SvgElement::Hide()
    {
        SetStyle("visibility", "hidden");
    }

    void SvgElement::Show()
    {
        SetStyle("visibility", "visible");
    }

    bool SvgElement::IsVisible() const
    {
        auto visibility = Style("visibility");
        return !visibility.has_value() || *visibility != "hidden";
    }

    void SvgElement::SetOpacity(float opacity)
    {
        SetStyle("opacity", ToString(clamp(opacity, 0.f, 1.f)));
    }

    std::string SvgElement::Serialize() const
    {
        std::string out;
        out.reserve(256);
        Serialize(out, 0);
        return out;
    }

    void SvgElement::Serialize(std::string& out, int depth) const
    {
        out.append(depth * 2, ' ');
        out.push_back('<');
        out.append(name);

        for (const auto& [key, value] : attributes)
        {
            out.push_back(' ');
            out.append(key);
            out.append("=\"");
            AppendEscaped(out, value);
            out.push_back('"');
        }

        if (!styles.empty())
        {
            out.append(" style=\"");
            for (const auto& [key, value] : styles)
            {
                out.append(key).push_back(':');
                AppendEscaped(out, value);
                out.push_back(';');
            }
            out.push_back('"');
        }

        if (children.empty())
        {
            out.append("/>\n");
            return;
        }

        out.append(">\n");
        for (const auto& child : children)
            child->Serialize(out, depth + 1);

        out.append(depth * 2, ' ');
        out.append("</").append(name).append(">\n");
    }
}
