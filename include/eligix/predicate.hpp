#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "eligix/attributes.hpp"

namespace eligix {

    namespace detail {
        inline AttributeValue to_value(bool v) { return AttributeValue{v}; }
        inline AttributeValue to_value(int v) { return AttributeValue{static_cast<std::int64_t>(v)}; }
        inline AttributeValue to_value(long v) { return AttributeValue{static_cast<std::int64_t>(v)}; }
        inline AttributeValue to_value(long long v) { return AttributeValue{static_cast<std::int64_t>(v)}; }
        inline AttributeValue to_value(unsigned v) { return AttributeValue{static_cast<std::int64_t>(v)}; }
        inline AttributeValue to_value(float v) { return AttributeValue{static_cast<double>(v)}; }
        inline AttributeValue to_value(double v) { return AttributeValue{v}; }
        inline AttributeValue to_value(const char *v) { return AttributeValue{std::string(v)}; }
        inline AttributeValue to_value(const std::string &v) { return AttributeValue{v}; }
        inline AttributeValue to_value(const AttributeValue &v) { return v; }
    } // namespace detail

    /**
     * @brief Typed attribute predicate used as a layer's "where" clause
     *
     * A predicate is an immutable expression tree of comparisons combined with
     * and / or / not. Comparisons take attribute references or literal values on
     * either side. Trees are built with the factory functions and the boolean
     * operators, or parsed from a query string:
     *
     * @code
     * auto p = Predicate::eq("col1", 1) && !Predicate::eq("kind", "road");
     * auto q = Predicate::parse("col1 == 1 and not kind == 'road'");
     * @endcode
     *
     * Query grammar (lowest precedence first):
     *   or      := and (("or" | "||" | "|") and)*
     *   and     := unary (("and" | "&&" | "&") unary)*
     *   unary   := ("not" | "!" | "~") unary | "(" or ")" | compare
     *   compare := operand [("==" | "!=" | "<" | "<=" | ">" | ">=") operand]
     *   operand := identifier | `quoted identifier` | number | 'string' | "string"
     *              | true | false | True | False | null | None
     * A lone identifier is read as "identifier == true".
     */
    class Predicate {
      public:
        enum class Comparison { Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual };

        struct AttributeRef {
            std::string name;
        };

        using Operand = std::variant<AttributeRef, AttributeValue>;

        /// Generic comparison between two operands
        static Predicate compare(Operand lhs, Comparison op, Operand rhs);

        /// Parse a query string; throws InvalidFilterError on malformed input
        static Predicate parse(const std::string &expression);

        template <typename T> static Predicate eq(const std::string &attribute, const T &value) {
            return compare(AttributeRef{attribute}, Comparison::Equal, detail::to_value(value));
        }
        template <typename T> static Predicate ne(const std::string &attribute, const T &value) {
            return compare(AttributeRef{attribute}, Comparison::NotEqual, detail::to_value(value));
        }
        template <typename T> static Predicate lt(const std::string &attribute, const T &value) {
            return compare(AttributeRef{attribute}, Comparison::Less, detail::to_value(value));
        }
        template <typename T> static Predicate le(const std::string &attribute, const T &value) {
            return compare(AttributeRef{attribute}, Comparison::LessEqual, detail::to_value(value));
        }
        template <typename T> static Predicate gt(const std::string &attribute, const T &value) {
            return compare(AttributeRef{attribute}, Comparison::Greater, detail::to_value(value));
        }
        template <typename T> static Predicate ge(const std::string &attribute, const T &value) {
            return compare(AttributeRef{attribute}, Comparison::GreaterEqual, detail::to_value(value));
        }

        friend Predicate operator&&(const Predicate &lhs, const Predicate &rhs);
        friend Predicate operator||(const Predicate &lhs, const Predicate &rhs);
        friend Predicate operator!(const Predicate &operand);

        /**
         * @brief Evaluate against one attribute record
         *
         * @throws InvalidFilterError if a referenced attribute is absent, or if an
         *         ordering comparison mixes incompatible types
         */
        bool evaluate(const AttributeRecord &record) const;

        /// Names of all referenced attributes, sorted and unique
        std::vector<std::string> attributes() const;

        /// Canonical, fully parenthesized query text (parses back to an equal tree)
        std::string to_string() const;

        struct Node;

      private:
        explicit Predicate(std::shared_ptr<const Node> root) : root_(std::move(root)) {}

        std::shared_ptr<const Node> root_;
    };

} // namespace eligix
