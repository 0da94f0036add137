#include "eligix/predicate.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <set>

#include "eligix/errors.hpp"

namespace eligix {

    struct Predicate::Node {
        enum class Kind { Compare, And, Or, Not };

        Kind kind = Kind::Compare;
        Operand lhs;
        Operand rhs;
        Comparison op = Comparison::Equal;
        std::shared_ptr<const Node> left;
        std::shared_ptr<const Node> right;
    };

    namespace {

        using Node = Predicate::Node;
        using Comparison = Predicate::Comparison;

        const AttributeValue &resolve(const Predicate::Operand &operand, const AttributeRecord &record) {
            if (const auto *ref = std::get_if<Predicate::AttributeRef>(&operand)) {
                auto it = record.find(ref->name);
                if (it == record.end()) {
                    throw InvalidFilterError("attribute '" + ref->name + "' is not present");
                }
                return it->second;
            }
            return std::get<AttributeValue>(operand);
        }

        bool values_equal(const AttributeValue &a, const AttributeValue &b) {
            if (is_numeric(a) && is_numeric(b)) {
                if (std::holds_alternative<std::int64_t>(a) && std::holds_alternative<std::int64_t>(b))
                    return std::get<std::int64_t>(a) == std::get<std::int64_t>(b);
                return as_double(a) == as_double(b);
            }
            if (a.index() != b.index())
                return false;
            return a == b;
        }

        /// <0, 0, >0 like strcmp; throws for types without a common ordering
        int values_order(const AttributeValue &a, const AttributeValue &b) {
            if (is_numeric(a) && is_numeric(b)) {
                if (std::holds_alternative<std::int64_t>(a) && std::holds_alternative<std::int64_t>(b)) {
                    auto x = std::get<std::int64_t>(a);
                    auto y = std::get<std::int64_t>(b);
                    return x < y ? -1 : (x > y ? 1 : 0);
                }
                double x = as_double(a);
                double y = as_double(b);
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
                return std::get<std::string>(a).compare(std::get<std::string>(b));
            }
            if (std::holds_alternative<bool>(a) && std::holds_alternative<bool>(b)) {
                return static_cast<int>(std::get<bool>(a)) - static_cast<int>(std::get<bool>(b));
            }
            throw InvalidFilterError("cannot order " + type_name(a) + " " + to_string(a) + " against " +
                                     type_name(b) + " " + to_string(b));
        }

        bool compare_values(const AttributeValue &a, Comparison op, const AttributeValue &b) {
            switch (op) {
            case Comparison::Equal:
                return values_equal(a, b);
            case Comparison::NotEqual:
                return !values_equal(a, b);
            default:
                break;
            }
            // NaN never orders
            if (is_numeric(a) && is_numeric(b) && (as_double(a) != as_double(a) || as_double(b) != as_double(b)))
                return false;
            int order = values_order(a, b);
            switch (op) {
            case Comparison::Less:
                return order < 0;
            case Comparison::LessEqual:
                return order <= 0;
            case Comparison::Greater:
                return order > 0;
            default:
                return order >= 0;
            }
        }

        bool evaluate_node(const Node &node, const AttributeRecord &record) {
            switch (node.kind) {
            case Node::Kind::Compare:
                return compare_values(resolve(node.lhs, record), node.op, resolve(node.rhs, record));
            case Node::Kind::And:
                // both sides are checked so absent attributes surface regardless of order
                return evaluate_node(*node.left, record) & evaluate_node(*node.right, record);
            case Node::Kind::Or:
                return evaluate_node(*node.left, record) | evaluate_node(*node.right, record);
            case Node::Kind::Not:
                return !evaluate_node(*node.left, record);
            }
            return false;
        }

        void collect_attributes(const Node &node, std::set<std::string> &out) {
            auto add = [&out](const Predicate::Operand &operand) {
                if (const auto *ref = std::get_if<Predicate::AttributeRef>(&operand))
                    out.insert(ref->name);
            };
            if (node.kind == Node::Kind::Compare) {
                add(node.lhs);
                add(node.rhs);
                return;
            }
            if (node.left)
                collect_attributes(*node.left, out);
            if (node.right)
                collect_attributes(*node.right, out);
        }

        bool is_keyword(const std::string &word) {
            static const std::set<std::string> keywords = {"and",   "or",    "not",  "true", "false",
                                                           "True",  "False", "null", "None"};
            return keywords.count(word) > 0;
        }

        bool is_plain_identifier(const std::string &name) {
            if (name.empty() || is_keyword(name))
                return false;
            if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_'))
                return false;
            return std::all_of(name.begin(), name.end(),
                               [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
        }

        std::string operand_text(const Predicate::Operand &operand) {
            if (const auto *ref = std::get_if<Predicate::AttributeRef>(&operand)) {
                return is_plain_identifier(ref->name) ? ref->name : "`" + ref->name + "`";
            }
            return to_string(std::get<AttributeValue>(operand));
        }

        const char *comparison_text(Comparison op) {
            switch (op) {
            case Comparison::Equal:
                return "==";
            case Comparison::NotEqual:
                return "!=";
            case Comparison::Less:
                return "<";
            case Comparison::LessEqual:
                return "<=";
            case Comparison::Greater:
                return ">";
            default:
                return ">=";
            }
        }

        std::string node_text(const Node &node) {
            switch (node.kind) {
            case Node::Kind::Compare:
                return operand_text(node.lhs) + " " + comparison_text(node.op) + " " + operand_text(node.rhs);
            case Node::Kind::And:
                return "(" + node_text(*node.left) + " and " + node_text(*node.right) + ")";
            case Node::Kind::Or:
                return "(" + node_text(*node.left) + " or " + node_text(*node.right) + ")";
            case Node::Kind::Not:
                if (node.left->kind == Node::Kind::Compare)
                    return "not (" + node_text(*node.left) + ")";
                return "not " + node_text(*node.left);
            }
            return {};
        }

        // ------------------------------------------------------------------ query parsing

        enum class TokenKind { Identifier, Literal, Compare, And, Or, Not, Minus, LParen, RParen, End };

        struct Token {
            TokenKind kind = TokenKind::End;
            std::size_t pos = 0;
            std::string text;
            AttributeValue value;
            Comparison op = Comparison::Equal;
        };

        class QueryLexer {
          public:
            explicit QueryLexer(const std::string &text) : text_(text) {}

            std::vector<Token> tokenize() {
                std::vector<Token> tokens;
                while (true) {
                    skip_space();
                    Token tok;
                    tok.pos = pos_;
                    if (pos_ >= text_.size()) {
                        tokens.push_back(tok);
                        return tokens;
                    }
                    char c = text_[pos_];
                    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                        lex_word(tok);
                    } else if (c == '`') {
                        lex_quoted_identifier(tok);
                    } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                               (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
                        lex_number(tok);
                    } else if (c == '\'' || c == '"') {
                        lex_string(tok);
                    } else {
                        lex_symbol(tok);
                    }
                    tokens.push_back(tok);
                }
            }

          private:
            [[noreturn]] void fail(const std::string &what, std::size_t at) const {
                throw InvalidFilterError("malformed where clause \"" + text_ + "\": " + what + " at position " +
                                         std::to_string(at));
            }

            char peek(std::size_t ahead) const {
                return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
            }

            void skip_space() {
                while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
                    ++pos_;
            }

            void lex_word(Token &tok) {
                std::size_t start = pos_;
                while (pos_ < text_.size() &&
                       (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_'))
                    ++pos_;
                tok.text = text_.substr(start, pos_ - start);
                if (tok.text == "and") {
                    tok.kind = TokenKind::And;
                } else if (tok.text == "or") {
                    tok.kind = TokenKind::Or;
                } else if (tok.text == "not") {
                    tok.kind = TokenKind::Not;
                } else if (tok.text == "true" || tok.text == "True") {
                    tok.kind = TokenKind::Literal;
                    tok.value = true;
                } else if (tok.text == "false" || tok.text == "False") {
                    tok.kind = TokenKind::Literal;
                    tok.value = false;
                } else if (tok.text == "null" || tok.text == "None") {
                    tok.kind = TokenKind::Literal;
                    tok.value = std::monostate{};
                } else {
                    tok.kind = TokenKind::Identifier;
                }
            }

            void lex_quoted_identifier(Token &tok) {
                std::size_t start = ++pos_;
                while (pos_ < text_.size() && text_[pos_] != '`')
                    ++pos_;
                if (pos_ >= text_.size())
                    fail("unterminated `identifier`", tok.pos);
                tok.kind = TokenKind::Identifier;
                tok.text = text_.substr(start, pos_ - start);
                ++pos_;
                if (tok.text.empty())
                    fail("empty `identifier`", tok.pos);
            }

            void lex_number(Token &tok) {
                std::size_t start = pos_;
                bool is_double = false;
                while (std::isdigit(static_cast<unsigned char>(peek(0))))
                    ++pos_;
                if (peek(0) == '.') {
                    is_double = true;
                    ++pos_;
                    while (std::isdigit(static_cast<unsigned char>(peek(0))))
                        ++pos_;
                }
                if (peek(0) == 'e' || peek(0) == 'E') {
                    std::size_t mark = pos_;
                    ++pos_;
                    if (peek(0) == '+' || peek(0) == '-')
                        ++pos_;
                    if (!std::isdigit(static_cast<unsigned char>(peek(0))))
                        fail("bad exponent", mark);
                    while (std::isdigit(static_cast<unsigned char>(peek(0))))
                        ++pos_;
                    is_double = true;
                }
                if (std::isalpha(static_cast<unsigned char>(peek(0))) || peek(0) == '_')
                    fail("unexpected character '" + std::string(1, peek(0)) + "'", pos_);

                tok.kind = TokenKind::Literal;
                tok.text = text_.substr(start, pos_ - start);
                if (is_double) {
                    tok.value = std::strtod(tok.text.c_str(), nullptr);
                } else {
                    errno = 0;
                    long long v = std::strtoll(tok.text.c_str(), nullptr, 10);
                    if (errno == ERANGE)
                        fail("integer out of range", start);
                    tok.value = static_cast<std::int64_t>(v);
                }
            }

            void lex_string(Token &tok) {
                char quote = text_[pos_++];
                std::string out;
                while (true) {
                    if (pos_ >= text_.size())
                        fail("unterminated string", tok.pos);
                    char c = text_[pos_++];
                    if (c == quote)
                        break;
                    if (c == '\\') {
                        if (pos_ >= text_.size())
                            fail("unterminated string", tok.pos);
                        c = text_[pos_++];
                    }
                    out += c;
                }
                tok.kind = TokenKind::Literal;
                tok.value = out;
                tok.text = out;
            }

            void lex_symbol(Token &tok) {
                char c = text_[pos_];
                char n = peek(1);
                auto take = [&](TokenKind kind, std::size_t len) {
                    tok.kind = kind;
                    tok.text = text_.substr(pos_, len);
                    pos_ += len;
                };
                auto take_compare = [&](Comparison op, std::size_t len) {
                    tok.op = op;
                    take(TokenKind::Compare, len);
                };

                if (c == '=' && n == '=') {
                    take_compare(Comparison::Equal, 2);
                } else if (c == '!' && n == '=') {
                    take_compare(Comparison::NotEqual, 2);
                } else if (c == '<' && n == '=') {
                    take_compare(Comparison::LessEqual, 2);
                } else if (c == '>' && n == '=') {
                    take_compare(Comparison::GreaterEqual, 2);
                } else if (c == '<') {
                    take_compare(Comparison::Less, 1);
                } else if (c == '>') {
                    take_compare(Comparison::Greater, 1);
                } else if (c == '&') {
                    take(TokenKind::And, n == '&' ? 2 : 1);
                } else if (c == '|') {
                    take(TokenKind::Or, n == '|' ? 2 : 1);
                } else if (c == '!' || c == '~') {
                    take(TokenKind::Not, 1);
                } else if (c == '-') {
                    take(TokenKind::Minus, 1);
                } else if (c == '(') {
                    take(TokenKind::LParen, 1);
                } else if (c == ')') {
                    take(TokenKind::RParen, 1);
                } else {
                    fail("unexpected character '" + std::string(1, c) + "'", pos_);
                }
            }

            const std::string &text_;
            std::size_t pos_ = 0;
        };

        class QueryParser {
          public:
            explicit QueryParser(const std::string &text) : text_(text), tokens_(QueryLexer(text).tokenize()) {}

            Predicate parse() {
                if (current().kind == TokenKind::End)
                    fail("empty expression");
                Predicate result = parse_or();
                if (current().kind != TokenKind::End)
                    fail("unexpected '" + current().text + "'");
                return result;
            }

          private:
            [[noreturn]] void fail(const std::string &what) const {
                throw InvalidFilterError("malformed where clause \"" + text_ + "\": " + what + " at position " +
                                         std::to_string(current().pos));
            }

            const Token &current() const { return tokens_[index_]; }

            Token next() { return tokens_[index_ < tokens_.size() - 1 ? index_++ : index_]; }

            Predicate parse_or() {
                Predicate lhs = parse_and();
                while (current().kind == TokenKind::Or) {
                    next();
                    lhs = lhs || parse_and();
                }
                return lhs;
            }

            Predicate parse_and() {
                Predicate lhs = parse_unary();
                while (current().kind == TokenKind::And) {
                    next();
                    lhs = lhs && parse_unary();
                }
                return lhs;
            }

            Predicate parse_unary() {
                if (current().kind == TokenKind::Not) {
                    next();
                    return !parse_unary();
                }
                if (current().kind == TokenKind::LParen) {
                    next();
                    Predicate inner = parse_or();
                    if (current().kind != TokenKind::RParen)
                        fail("expected ')'");
                    next();
                    return inner;
                }
                return parse_compare();
            }

            Predicate parse_compare() {
                Predicate::Operand lhs = parse_operand();
                if (current().kind != TokenKind::Compare) {
                    if (std::holds_alternative<Predicate::AttributeRef>(lhs))
                        return Predicate::compare(lhs, Comparison::Equal, AttributeValue{true});
                    fail("expected comparison operator");
                }
                Comparison op = next().op;
                Predicate::Operand rhs = parse_operand();
                return Predicate::compare(std::move(lhs), op, std::move(rhs));
            }

            Predicate::Operand parse_operand() {
                const Token &tok = current();
                if (tok.kind == TokenKind::Identifier) {
                    next();
                    return Predicate::AttributeRef{tok.text};
                }
                if (tok.kind == TokenKind::Minus) {
                    next();
                    const Token &num = current();
                    if (num.kind != TokenKind::Literal || !is_numeric(num.value))
                        fail("expected number after '-'");
                    next();
                    if (const auto *i = std::get_if<std::int64_t>(&num.value))
                        return AttributeValue{-*i};
                    return AttributeValue{-std::get<double>(num.value)};
                }
                if (tok.kind == TokenKind::Literal) {
                    next();
                    return tok.value;
                }
                if (tok.kind == TokenKind::End)
                    fail("unexpected end of expression");
                fail("unexpected '" + tok.text + "'");
            }

            const std::string &text_;
            std::vector<Token> tokens_;
            std::size_t index_ = 0;
        };

    } // namespace

    Predicate Predicate::compare(Operand lhs, Comparison op, Operand rhs) {
        auto node = std::make_shared<Node>();
        node->kind = Node::Kind::Compare;
        node->lhs = std::move(lhs);
        node->op = op;
        node->rhs = std::move(rhs);
        return Predicate(std::move(node));
    }

    Predicate Predicate::parse(const std::string &expression) { return QueryParser(expression).parse(); }

    Predicate operator&&(const Predicate &lhs, const Predicate &rhs) {
        auto node = std::make_shared<Predicate::Node>();
        node->kind = Predicate::Node::Kind::And;
        node->left = lhs.root_;
        node->right = rhs.root_;
        return Predicate(std::move(node));
    }

    Predicate operator||(const Predicate &lhs, const Predicate &rhs) {
        auto node = std::make_shared<Predicate::Node>();
        node->kind = Predicate::Node::Kind::Or;
        node->left = lhs.root_;
        node->right = rhs.root_;
        return Predicate(std::move(node));
    }

    Predicate operator!(const Predicate &operand) {
        auto node = std::make_shared<Predicate::Node>();
        node->kind = Predicate::Node::Kind::Not;
        node->left = operand.root_;
        return Predicate(std::move(node));
    }

    bool Predicate::evaluate(const AttributeRecord &record) const { return evaluate_node(*root_, record); }

    std::vector<std::string> Predicate::attributes() const {
        std::set<std::string> names;
        collect_attributes(*root_, names);
        return {names.begin(), names.end()};
    }

    std::string Predicate::to_string() const { return node_text(*root_); }

} // namespace eligix
