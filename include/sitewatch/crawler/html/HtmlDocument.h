#pragma once

#include <gumbo.h>

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sitewatch::crawler::html {

using NodeSet = std::unordered_set<const GumboNode*>;

// Owns a gumbo parse tree and the source text it points into.
class HtmlDocument {
public:
    explicit HtmlDocument(std::string html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    const GumboNode* root() const;

    // Elements matching a CSS selector, in document order. A selector the
    // engine cannot parse matches nothing.
    std::vector<const GumboNode*> select(const std::string& selector) const;
    const GumboNode* selectFirst(const std::string& selector) const;

    // First element with the given tag, or nullptr.
    const GumboNode* findFirst(GumboTag tag) const;

private:
    std::string html_;
    GumboOutput* output_;
};

// Lower-case tag name, including for elements gumbo does not know.
std::string tagName(const GumboNode* node);

bool isElement(const GumboNode* node);

std::optional<std::string> attribute(const GumboNode* node, const char* name);

// Concatenated descendant text, one space between text nodes. Subtrees rooted
// at nodes in `excluded` and script/style/noscript bodies are skipped.
std::string textContent(const GumboNode* node, const NodeSet* excluded = nullptr);

// Collapses runs of whitespace to a single space and trims both ends.
std::string collapseWhitespace(const std::string& text);

// Nearest ancestor-or-self element with the given tag, or nullptr.
const GumboNode* closest(const GumboNode* node, GumboTag tag);

// Calls `visit` for every element under `node` (inclusive), in document order.
template <typename Visitor>
void forEachElement(const GumboNode* node, Visitor&& visit) {
    if (!isElement(node)) return;
    visit(node);
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        forEachElement(static_cast<const GumboNode*>(children.data[i]), visit);
    }
}

} // namespace sitewatch::crawler::html
