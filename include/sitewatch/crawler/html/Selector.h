#pragma once

#include <gumbo.h>

#include <optional>
#include <string>
#include <vector>

namespace sitewatch::crawler::html {

// The CSS subset used by templates and login-form discovery:
//   tag, *, #id, .class,
//   [attr], [attr=v], [attr*=v], [attr^=v], [attr$=v], [attr~=v] with an optional " i" flag,
//   :has-text("text") (case-insensitive substring of the element text),
//   descendant (whitespace) and child (>) combinators, and comma-separated groups.
class Selector {
public:
    // std::nullopt for anything outside the supported subset.
    static std::optional<Selector> parse(const std::string& text);

    bool matches(const GumboNode* node) const;

    // Matching elements under `root` (inclusive), in document order, without duplicates.
    std::vector<const GumboNode*> selectAll(const GumboNode* root) const;
    const GumboNode* selectFirst(const GumboNode* root) const;

private:
    enum class AttrOp { EXISTS, EQUALS, CONTAINS, PREFIX, SUFFIX, WORD };

    struct AttributeTest {
        std::string name;
        AttrOp op = AttrOp::EXISTS;
        std::string value;
        bool ignoreCase = false;
    };

    struct Compound {
        std::string tag;  // empty matches any element
        std::string id;
        std::vector<std::string> classes;
        std::vector<AttributeTest> attributes;
        std::vector<std::string> hasText;  // stored lower-case
    };

    // parts[i] is joined to parts[i + 1] by combinators[i] (' ' or '>').
    struct Complex {
        std::vector<Compound> parts;
        std::vector<char> combinators;
    };

    static bool matchesCompound(const GumboNode* node, const Compound& compound);
    static bool matchesComplex(const GumboNode* node, const Complex& complex, size_t index);
    static bool matchesAttribute(const GumboNode* node, const AttributeTest& test);

    friend class SelectorParser;
    std::vector<Complex> groups_;
};

} // namespace sitewatch::crawler::html
