#ifndef ARGUMENT_SYSTEM_LITERAL_H
#define ARGUMENT_SYSTEM_LITERAL_H

#include <string>
#include <memory>
#include <functional>

namespace ArgumentSystem
{
    // 原子命题加极性，构造后不可变
    class Literal
    {
    public:
        Literal(const std::string &atom, bool positive = true);

        const std::string &getAtom() const;
        bool isPositive() const;

        // 互补文字：原子相同，极性相反
        bool isNegationOf(const Literal &other) const;
        Literal negation() const;

        // 规范键，同时也是文法中的写法，例如 "a" 或 "~a"
        std::string key() const;
        std::string toString() const;

        // 原子名必须满足 [A-Za-z][A-Za-z0-9_]*
        static bool isValidAtom(const std::string &atom);

        bool operator==(const Literal &other) const;
        bool operator!=(const Literal &other) const;
        bool operator<(const Literal &other) const;

        size_t hash() const
        {
            size_t h = std::hash<std::string>{}(atom);
            h ^= std::hash<bool>{}(positive) + 0x9e3779b9 + (h << 6) + (h >> 2);
            return h;
        }

    private:
        std::string atom;
        bool positive;
    };

    // 知识库内所有结构共享同一个文字实例
    using LiteralPtr = std::shared_ptr<const Literal>;
}

namespace std
{
    template <>
    struct hash<ArgumentSystem::Literal>
    {
        size_t operator()(const ArgumentSystem::Literal &lit) const
        {
            return lit.hash();
        }
    };
}
#endif // ARGUMENT_SYSTEM_LITERAL_H
