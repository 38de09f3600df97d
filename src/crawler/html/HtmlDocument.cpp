#include "../../../include/sitewatch/crawler/html/HtmlDocument.h"
#include "../../../include/sitewatch/crawler/html/Selector.h"
#include "../../../include/sitewatch/common/Logger.h"

#include <algorithm>
#include <cctype>

namespace sitewatch::crawler::html {

HtmlDocument::HtmlDocument(std::string html)
    : html_(std::move(html))
    , output_(gumbo_parse_with_options(&kGumboDefaultOptions, html_.data(), html_.size())) {
}

HtmlDocument::~HtmlDocument() {
    if (output_) {
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
    }
}

const GumboNode* HtmlDocument::root() const {
    return output_ ? output_->root : nullptr;
}

std::vector<const GumboNode*> HtmlDocument::select(const std::string& selector) const {
    auto parsed = Selector::parse(selector);
    if (!parsed) {
        LOG_DEBUG("Unsupported selector ignored: " + selector);
        return {};
    }
    return parsed->selectAll(root());
}

const GumboNode* HtmlDocument::selectFirst(const std::string& selector) const {
    auto parsed = Selector::parse(selector);
    if (!parsed) {
        LOG_DEBUG("Unsupported selector ignored: " + selector);
        return nullptr;
    }
    return parsed->selectFirst(root());
}

const GumboNode* HtmlDocument::findFirst(GumboTag tag) const {
    const GumboNode* found = nullptr;
    forEachElement(root(), [&](const GumboNode* node) {
        if (!found && node->v.element.tag == tag) found = node;
    });
    return found;
}

bool isElement(const GumboNode* node) {
    return node != nullptr && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

std::string tagName(const GumboNode* node) {
    if (!isElement(node)) return "";
    if (node->v.element.tag != GUMBO_TAG_UNKNOWN) {
        return gumbo_normalized_tagname(node->v.element.tag);
    }
    GumboStringPiece piece = node->v.element.original_tag;
    gumbo_tag_from_original_text(&piece);
    std::string name(piece.data ? piece.data : "", piece.length);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::optional<std::string> attribute(const GumboNode* node, const char* name) {
    if (!isElement(node)) return std::nullopt;
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    if (!attr) return std::nullopt;
    return std::string(attr->value);
}

namespace {

void appendText(const GumboNode* node, const NodeSet* excluded, std::string& out) {
    if (node == nullptr) return;
    if (excluded && excluded->count(node) > 0) return;

    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
        case GUMBO_NODE_WHITESPACE:
            out += node->v.text.text;
            out += ' ';
            return;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            GumboTag tag = node->v.element.tag;
            if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT) {
                return;
            }
            const GumboVector& children = node->v.element.children;
            for (unsigned int i = 0; i < children.length; ++i) {
                appendText(static_cast<const GumboNode*>(children.data[i]), excluded, out);
            }
            return;
        }
        default:
            return;
    }
}

} // namespace

std::string textContent(const GumboNode* node, const NodeSet* excluded) {
    std::string out;
    appendText(node, excluded, out);
    return out;
}

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

const GumboNode* closest(const GumboNode* node, GumboTag tag) {
    for (const GumboNode* current = node; current != nullptr; current = current->parent) {
        if (isElement(current) && current->v.element.tag == tag) return current;
    }
    return nullptr;
}

} // namespace sitewatch::crawler::html
