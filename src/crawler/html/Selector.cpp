#include "../../../include/sitewatch/crawler/html/Selector.h"
#include "../../../include/sitewatch/crawler/html/HtmlDocument.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace sitewatch::crawler::html {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

} // namespace

// Recursive-descent parser over the selector text. Any unsupported construct
// makes the whole selector invalid.
class SelectorParser {
public:
    explicit SelectorParser(const std::string& text) : text_(text) {}

    std::optional<Selector> run() {
        Selector selector;
        while (true) {
            skipSpaces();
            auto complex = parseComplex();
            if (!complex) return std::nullopt;
            selector.groups_.push_back(std::move(*complex));
            skipSpaces();
            if (atEnd()) break;
            if (peek() != ',') return std::nullopt;
            ++pos_;
        }
        if (selector.groups_.empty()) return std::nullopt;
        return selector;
    }

private:
    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return atEnd() ? '\0' : text_[pos_]; }

    bool skipSpaces() {
        size_t start = pos_;
        while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        return pos_ > start;
    }

    std::string readIdent() {
        size_t start = pos_;
        while (!atEnd() && isIdentChar(text_[pos_])) ++pos_;
        return text_.substr(start, pos_ - start);
    }

    std::optional<std::string> readQuoted() {
        char quote = peek();
        if (quote != '"' && quote != '\'') return std::nullopt;
        ++pos_;
        std::string value;
        while (!atEnd() && text_[pos_] != quote) {
            if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) ++pos_;
            value += text_[pos_++];
        }
        if (atEnd()) return std::nullopt;
        ++pos_;
        return value;
    }

    std::optional<Selector::Complex> parseComplex() {
        Selector::Complex complex;
        auto first = parseCompound();
        if (!first) return std::nullopt;
        complex.parts.push_back(std::move(*first));

        while (true) {
            bool sawSpace = skipSpaces();
            if (atEnd() || peek() == ',') break;
            char combinator = ' ';
            if (peek() == '>') {
                combinator = '>';
                ++pos_;
                skipSpaces();
            } else if (!sawSpace) {
                return std::nullopt;
            }
            auto next = parseCompound();
            if (!next) return std::nullopt;
            complex.combinators.push_back(combinator);
            complex.parts.push_back(std::move(*next));
        }
        return complex;
    }

    std::optional<Selector::Compound> parseCompound() {
        Selector::Compound compound;
        bool any = false;

        if (peek() == '*') {
            ++pos_;
            any = true;
        } else if (isIdentChar(peek())) {
            compound.tag = toLower(readIdent());
            any = true;
        }

        while (!atEnd()) {
            char c = peek();
            if (c == '#') {
                ++pos_;
                compound.id = readIdent();
                if (compound.id.empty()) return std::nullopt;
            } else if (c == '.') {
                ++pos_;
                std::string cls = readIdent();
                if (cls.empty()) return std::nullopt;
                compound.classes.push_back(std::move(cls));
            } else if (c == '[') {
                ++pos_;
                auto attr = parseAttribute();
                if (!attr) return std::nullopt;
                compound.attributes.push_back(std::move(*attr));
            } else if (c == ':') {
                ++pos_;
                if (readIdent() != "has-text" || peek() != '(') return std::nullopt;
                ++pos_;
                skipSpaces();
                auto value = readQuoted();
                if (!value) return std::nullopt;
                skipSpaces();
                if (peek() != ')') return std::nullopt;
                ++pos_;
                compound.hasText.push_back(toLower(*value));
            } else {
                break;
            }
            any = true;
        }
        if (!any) return std::nullopt;
        return compound;
    }

    std::optional<Selector::AttributeTest> parseAttribute() {
        Selector::AttributeTest test;
        skipSpaces();
        test.name = toLower(readIdent());
        if (test.name.empty()) return std::nullopt;
        skipSpaces();

        if (peek() == ']') {
            ++pos_;
            return test;
        }

        char c = peek();
        if (c == '=') {
            test.op = Selector::AttrOp::EQUALS;
            ++pos_;
        } else if ((c == '*' || c == '^' || c == '$' || c == '~') && pos_ + 1 < text_.size() && text_[pos_ + 1] == '=') {
            test.op = c == '*' ? Selector::AttrOp::CONTAINS
                    : c == '^' ? Selector::AttrOp::PREFIX
                    : c == '$' ? Selector::AttrOp::SUFFIX
                    : Selector::AttrOp::WORD;
            pos_ += 2;
        } else {
            return std::nullopt;
        }

        skipSpaces();
        if (peek() == '"' || peek() == '\'') {
            auto quoted = readQuoted();
            if (!quoted) return std::nullopt;
            test.value = *quoted;
        } else {
            test.value = readIdent();
            if (test.value.empty()) return std::nullopt;
        }

        skipSpaces();
        if (peek() == 'i' || peek() == 'I') {
            test.ignoreCase = true;
            ++pos_;
            skipSpaces();
        }
        if (peek() != ']') return std::nullopt;
        ++pos_;
        return test;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

std::optional<Selector> Selector::parse(const std::string& text) {
    return SelectorParser(text).run();
}

bool Selector::matchesAttribute(const GumboNode* node, const AttributeTest& test) {
    auto value = attribute(node, test.name.c_str());
    if (!value) return false;
    if (test.op == AttrOp::EXISTS) return true;

    std::string actual = test.ignoreCase ? toLower(*value) : *value;
    std::string expected = test.ignoreCase ? toLower(test.value) : test.value;

    switch (test.op) {
        case AttrOp::EQUALS:
            return actual == expected;
        case AttrOp::CONTAINS:
            return !expected.empty() && actual.find(expected) != std::string::npos;
        case AttrOp::PREFIX:
            return !expected.empty() && actual.compare(0, expected.size(), expected) == 0;
        case AttrOp::SUFFIX:
            return !expected.empty() && actual.size() >= expected.size() &&
                   actual.compare(actual.size() - expected.size(), expected.size(), expected) == 0;
        case AttrOp::WORD: {
            std::istringstream words(actual);
            std::string word;
            while (words >> word) {
                if (word == expected) return true;
            }
            return false;
        }
        case AttrOp::EXISTS:
            return true;
    }
    return false;
}

bool Selector::matchesCompound(const GumboNode* node, const Compound& compound) {
    if (!isElement(node)) return false;
    if (!compound.tag.empty() && tagName(node) != compound.tag) return false;

    if (!compound.id.empty()) {
        auto id = attribute(node, "id");
        if (!id || *id != compound.id) return false;
    }

    if (!compound.classes.empty()) {
        auto cls = attribute(node, "class");
        if (!cls) return false;
        std::istringstream words(*cls);
        std::vector<std::string> present;
        std::string word;
        while (words >> word) present.push_back(word);
        for (const auto& required : compound.classes) {
            if (std::find(present.begin(), present.end(), required) == present.end()) return false;
        }
    }

    for (const auto& test : compound.attributes) {
        if (!matchesAttribute(node, test)) return false;
    }

    if (!compound.hasText.empty()) {
        std::string text = toLower(collapseWhitespace(textContent(node)));
        for (const auto& needle : compound.hasText) {
            if (text.find(needle) == std::string::npos) return false;
        }
    }
    return true;
}

bool Selector::matchesComplex(const GumboNode* node, const Complex& complex, size_t index) {
    if (!matchesCompound(node, complex.parts[index])) return false;
    if (index == 0) return true;

    char combinator = complex.combinators[index - 1];
    if (combinator == '>') {
        const GumboNode* parent = node->parent;
        return isElement(parent) && matchesComplex(parent, complex, index - 1);
    }
    for (const GumboNode* ancestor = node->parent; isElement(ancestor); ancestor = ancestor->parent) {
        if (matchesComplex(ancestor, complex, index - 1)) return true;
    }
    return false;
}

bool Selector::matches(const GumboNode* node) const {
    for (const auto& complex : groups_) {
        if (matchesComplex(node, complex, complex.parts.size() - 1)) return true;
    }
    return false;
}

std::vector<const GumboNode*> Selector::selectAll(const GumboNode* root) const {
    std::vector<const GumboNode*> out;
    forEachElement(root, [&](const GumboNode* node) {
        if (matches(node)) out.push_back(node);
    });
    return out;
}

const GumboNode* Selector::selectFirst(const GumboNode* root) const {
    const GumboNode* found = nullptr;
    forEachElement(root, [&](const GumboNode* node) {
        if (!found && matches(node)) found = node;
    });
    return found;
}

} // namespace sitewatch::crawler::html
