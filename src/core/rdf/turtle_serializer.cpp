/**
 * @file turtle_serializer.cpp
 * @brief Turtle writer and subset parser
 */

#include "turtle_serializer.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace slopgraph {
namespace rdf {

namespace {

// =============================================================================
// Lexer
// =============================================================================

enum class TokenType {
    IRIREF,          // <...>
    PNAME,           // prefix:local
    STRING,          // "..." (unescaped value)
    NUMBER,          // 42, 3.5, 1e3
    BOOLEAN,         // true / false
    KEYWORD_A,       // a
    PREFIX_AT,       // @prefix
    PREFIX_SPARQL,   // PREFIX
    DATATYPE_MARK,   // ^^
    DOT,
    SEMICOLON,
    COMMA,
    END
};

struct Token {
    TokenType type = TokenType::END;
    std::string text;
    size_t line = 1;
};

struct ParseError : std::runtime_error {
    ParseError(size_t line, const std::string& message)
        : std::runtime_error(std::format("line {}: {}", line, message)) {}
};

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool isNameChar(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u >= 0x80 ||
           c == '_' || c == '-' || c == '.' || c == ':' || c == '%';
}

class Lexer {
public:
    explicit Lexer(std::string_view text) : text_(text) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            Token token = next();
            bool done = token.type == TokenType::END;
            tokens.push_back(std::move(token));
            if (done) break;
        }
        return tokens;
    }

private:
    Token make(TokenType type, std::string text = {}) const {
        return Token{type, std::move(text), line_};
    }

    void skipWhitespaceAndComments() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '\n') {
                line_++;
                pos_++;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                pos_++;
            } else if (c == '#') {
                while (pos_ < text_.size() && text_[pos_] != '\n') pos_++;
            } else {
                break;
            }
        }
    }

    Token next() {
        skipWhitespaceAndComments();
        if (pos_ >= text_.size()) {
            return make(TokenType::END);
        }

        char c = text_[pos_];
        switch (c) {
            case '<': return readIriRef();
            case '"':
            case '\'': return readString(c);
            case '.': pos_++; return make(TokenType::DOT);
            case ';': pos_++; return make(TokenType::SEMICOLON);
            case ',': pos_++; return make(TokenType::COMMA);
            case '^':
                if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '^') {
                    pos_ += 2;
                    return make(TokenType::DATATYPE_MARK);
                }
                throw ParseError(line_, "expected '^^'");
            case '@': return readDirective();
            case '[':
            case '(':
                throw ParseError(line_, "blank nodes and collections are not supported");
            default:
                break;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-') {
            return readNumber();
        }
        if (c == '_' && pos_ + 1 < text_.size() && text_[pos_ + 1] == ':') {
            throw ParseError(line_, "blank nodes are not supported");
        }
        if (isNameChar(c) || c == '\\') {
            return readName();
        }

        throw ParseError(line_, std::format("unexpected character '{}'", c));
    }

    Token readIriRef() {
        size_t start_line = line_;
        pos_++;  // '<'
        std::string iri;
        while (pos_ < text_.size() && text_[pos_] != '>') {
            char c = text_[pos_];
            if (c == '\n' || c == ' ' || c == '"') {
                throw ParseError(line_, "invalid character in IRI");
            }
            iri.push_back(c);
            pos_++;
        }
        if (pos_ >= text_.size()) {
            throw ParseError(start_line, "unterminated IRI");
        }
        pos_++;  // '>'
        return Token{TokenType::IRIREF, std::move(iri), start_line};
    }

    uint32_t readHex(size_t digits) {
        if (pos_ + digits > text_.size()) {
            throw ParseError(line_, "truncated unicode escape");
        }
        uint32_t cp = 0;
        for (size_t i = 0; i < digits; i++) {
            char h = text_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else throw ParseError(line_, "invalid unicode escape");
        }
        return cp;
    }

    Token readString(char quote) {
        size_t start_line = line_;
        if (text_.substr(pos_, 3) == std::string(3, quote)) {
            throw ParseError(line_, "long string literals are not supported");
        }
        pos_++;  // opening quote

        std::string value;
        while (true) {
            if (pos_ >= text_.size() || text_[pos_] == '\n') {
                throw ParseError(start_line, "unterminated string literal");
            }
            char c = text_[pos_++];
            if (c == quote) break;
            if (c != '\\') {
                value.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                throw ParseError(line_, "dangling escape");
            }
            char e = text_[pos_++];
            switch (e) {
                case 'n':  value.push_back('\n'); break;
                case 'r':  value.push_back('\r'); break;
                case 't':  value.push_back('\t'); break;
                case 'b':  value.push_back('\b'); break;
                case 'f':  value.push_back('\f'); break;
                case '"':  value.push_back('"'); break;
                case '\'': value.push_back('\''); break;
                case '\\': value.push_back('\\'); break;
                case 'u':  appendUtf8(value, readHex(4)); break;
                case 'U':  appendUtf8(value, readHex(8)); break;
                default:
                    throw ParseError(line_, std::format("unknown escape '\\{}'", e));
            }
        }

        if (pos_ < text_.size() && text_[pos_] == '@') {
            throw ParseError(line_, "language tags are not supported");
        }
        return Token{TokenType::STRING, std::move(value), start_line};
    }

    Token readDirective() {
        size_t start = ++pos_;
        while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_]))) pos_++;
        auto word = text_.substr(start, pos_ - start);
        if (word == "prefix") {
            return make(TokenType::PREFIX_AT);
        }
        throw ParseError(line_, std::format("unsupported directive '@{}'", word));
    }

    Token readNumber() {
        size_t start = pos_;
        pos_++;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' ||
                c == 'e' || c == 'E' ||
                ((c == '+' || c == '-') && (text_[pos_ - 1] == 'e' || text_[pos_ - 1] == 'E'))) {
                pos_++;
            } else {
                break;
            }
        }
        // A trailing '.' terminates the statement
        while (pos_ > start + 1 && text_[pos_ - 1] == '.') pos_--;

        std::string number(text_.substr(start, pos_ - start));
        if (!std::any_of(number.begin(), number.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            throw ParseError(line_, std::format("malformed number '{}'", number));
        }
        return make(TokenType::NUMBER, std::move(number));
    }

    Token readName() {
        std::string name;
        size_t raw_end = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '\\' && pos_ + 1 < text_.size()) {
                name.push_back(text_[pos_ + 1]);
                pos_ += 2;
                raw_end = pos_;
                continue;
            }
            if (!isNameChar(c)) break;
            name.push_back(c);
            pos_++;
            if (c != '.') raw_end = pos_;
        }
        // Names never end with '.', give it back to the statement terminator
        size_t trailing = pos_ - raw_end;
        pos_ = raw_end;
        name.resize(name.size() - trailing);

        if (name == "a") return make(TokenType::KEYWORD_A);
        if (name == "true" || name == "false") return make(TokenType::BOOLEAN, name);

        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        if (upper == "PREFIX") return make(TokenType::PREFIX_SPARQL);
        if (upper == "BASE") throw ParseError(line_, "BASE directives are not supported");

        if (name.find(':') == std::string::npos) {
            throw ParseError(line_, std::format("unexpected token '{}'", name));
        }
        return make(TokenType::PNAME, std::move(name));
    }

    std::string_view text_;
    size_t pos_ = 0;
    size_t line_ = 1;
};

// =============================================================================
// Parser
// =============================================================================

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    StatementSet parseDocument() {
        while (peek().type != TokenType::END) {
            if (peek().type == TokenType::PREFIX_AT) {
                advance();
                parsePrefixBinding();
                expect(TokenType::DOT, "'.' after @prefix");
            } else if (peek().type == TokenType::PREFIX_SPARQL) {
                advance();
                parsePrefixBinding();
            } else {
                Iri subject = parseIri("subject");
                parsePredicateObjectList(subject);
                expect(TokenType::DOT, "'.' at end of statement");
            }
        }
        result_.namespaces = table_.bindings();
        return std::move(result_);
    }

private:
    const Token& peek() const { return tokens_[pos_]; }

    const Token& advance() {
        const Token& token = tokens_[pos_];
        if (token.type != TokenType::END) pos_++;
        return token;
    }

    const Token& expect(TokenType type, const char* what) {
        if (peek().type != type) {
            throw ParseError(peek().line, std::format("expected {}", what));
        }
        return advance();
    }

    void parsePrefixBinding() {
        const Token& name = expect(TokenType::PNAME, "prefix name");
        if (name.text.back() != ':' || name.text.find(':') != name.text.size() - 1) {
            throw ParseError(name.line, std::format("malformed prefix '{}'", name.text));
        }
        const Token& uri = expect(TokenType::IRIREF, "namespace IRI");
        table_.bind(name.text.substr(0, name.text.size() - 1), uri.text);
    }

    Iri resolvePrefixedName(const Token& token) {
        auto expanded = table_.expand(token.text);
        if (expanded.isError()) {
            throw ParseError(token.line, expanded.errorMessage());
        }
        return std::move(expanded).value();
    }

    Iri parseIri(const char* role) {
        const Token& token = peek();
        if (token.type == TokenType::IRIREF) {
            advance();
            return token.text;
        }
        if (token.type == TokenType::PNAME) {
            advance();
            return resolvePrefixedName(token);
        }
        throw ParseError(token.line, std::format("expected IRI for {}", role));
    }

    void parsePredicateObjectList(const Iri& subject) {
        while (true) {
            Iri predicate;
            if (peek().type == TokenType::KEYWORD_A) {
                advance();
                predicate = vocab::RDF_TYPE;
            } else {
                predicate = parseIri("predicate");
            }

            parseObjectList(subject, predicate);

            if (peek().type != TokenType::SEMICOLON) break;
            while (peek().type == TokenType::SEMICOLON) advance();
            if (peek().type == TokenType::DOT || peek().type == TokenType::END) break;
        }
    }

    void parseObjectList(const Iri& subject, const Iri& predicate) {
        result_.statements.push_back(Statement{subject, predicate, parseObject()});
        while (peek().type == TokenType::COMMA) {
            advance();
            result_.statements.push_back(Statement{subject, predicate, parseObject()});
        }
    }

    Term parseObject() {
        const Token& token = peek();
        switch (token.type) {
            case TokenType::IRIREF:
            case TokenType::PNAME:
                return Term::iri(parseIri("object"));

            case TokenType::STRING: {
                advance();
                if (peek().type == TokenType::DATATYPE_MARK) {
                    advance();
                    return Term::typed(token.text, parseIri("datatype"));
                }
                return Term::literal(token.text);
            }

            case TokenType::NUMBER: {
                advance();
                const auto& n = token.text;
                if (n.find_first_of("eE") != std::string::npos) return Term::typed(n, vocab::XSD_DOUBLE);
                if (n.find('.') != std::string::npos) return Term::typed(n, vocab::XSD_DECIMAL);
                return Term::typed(n, vocab::XSD_INTEGER);
            }

            case TokenType::BOOLEAN:
                advance();
                return Term::typed(token.text, vocab::XSD_BOOLEAN);

            default:
                throw ParseError(token.line, "expected object");
        }
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    NamespaceTable table_;
    StatementSet result_;
};

} // anonymous namespace

// =============================================================================
// TurtleSerializer
// =============================================================================

TurtleSerializer::TurtleSerializer(NamespaceTable namespaces)
    : namespaces_(std::move(namespaces)) {
}

std::string TurtleSerializer::escapeLiteral(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

std::string TurtleSerializer::formatIri(const NamespaceTable& table, const Iri& iri) const {
    if (auto compacted = table.compact(iri)) {
        return *compacted;
    }
    return "<" + iri + ">";
}

std::string TurtleSerializer::formatObject(const NamespaceTable& table, const Term& term) const {
    switch (term.kind) {
        case TermKind::IRI:
            return formatIri(table, term.value);
        case TermKind::LITERAL:
            return "\"" + escapeLiteral(term.value) + "\"";
        case TermKind::TYPED_LITERAL:
            return "\"" + escapeLiteral(term.value) + "\"^^" + formatIri(table, term.datatype);
    }
    return {};
}

std::string TurtleSerializer::serialize(const StatementSet& statements) const {
    NamespaceTable table = namespaces_;
    for (const auto& [prefix, uri] : statements.namespaces) {
        if (!table.uriFor(prefix)) {
            table.bind(prefix, uri);
        }
    }

    std::string out;
    for (const auto& [prefix, uri] : table.bindings()) {
        out += std::format("@prefix {}: <{}> .\n", prefix, uri);
    }

    // Group by subject, first-seen order
    std::vector<Iri> subjects;
    std::unordered_map<Iri, std::vector<const Statement*>> blocks;
    for (const auto& statement : statements.statements) {
        auto [it, inserted] = blocks.try_emplace(statement.subject);
        if (inserted) {
            subjects.push_back(statement.subject);
        }
        it->second.push_back(&statement);
    }

    for (const auto& subject : subjects) {
        out += "\n";
        out += formatIri(table, subject);
        out += "\n";

        const auto& block = blocks[subject];
        for (size_t i = 0; i < block.size(); i++) {
            const Statement& s = *block[i];
            std::string predicate = s.predicate == vocab::RDF_TYPE ? "a" : formatIri(table, s.predicate);
            out += std::format("    {} {} {}\n", predicate, formatObject(table, s.object),
                               i + 1 == block.size() ? "." : ";");
        }
    }

    return out;
}

Result<StatementSet> TurtleSerializer::parse(std::string_view text) const {
    try {
        Lexer lexer(text);
        Parser parser(lexer.tokenize());
        return parser.parseDocument();
    } catch (const ParseError& e) {
        return Result<StatementSet>(ErrorCode::STORAGE_SERIALIZATION_ERROR,
            std::format("Turtle parse error at {}", e.what()));
    }
}

} // namespace rdf
} // namespace slopgraph
