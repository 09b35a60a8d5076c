#include "EvidenceEnumerator.h"
#include "KnowledgeBase.h"
#include <stdexcept>
#include <algorithm>

namespace ArgumentSystem
{
    EvidenceEnumerator::EvidenceEnumerator(const KnowledgeBase &kb, int literalId,
                                           const EvidenceOptions &options)
        : kb(kb), literalId(literalId), options(options)
    {
        if (!kb.getLiteral(literalId))
        {
            throw std::logic_error("EvidenceEnumerator: literal id " + std::to_string(literalId) +
                                   " is not in the knowledge base");
        }
        reset();
    }

    void EvidenceEnumerator::reset()
    {
        stack.clear();
        seen.clear();
        produced = 0;
        maxStackDepth = 0;
        exhausted = false;
        pushLiteralFrame(literalId, -1, 0);
    }

    void EvidenceEnumerator::pushLiteralFrame(int literal, int parent, size_t level)
    {
        Frame frame;
        frame.kind = FrameKind::LITERAL;
        frame.id = literal;
        frame.parent = parent;
        frame.level = level;
        stack.push_back(std::move(frame));
        maxStackDepth = std::max(maxStackDepth, stack.size());
    }

    void EvidenceEnumerator::pushRuleFrame(int rule, int parent)
    {
        Frame frame;
        frame.kind = FrameKind::RULE;
        frame.id = rule;
        frame.parent = parent;
        frame.level = 0;
        stack.push_back(std::move(frame));
        maxStackDepth = std::max(maxStackDepth, stack.size());
    }

    std::optional<EvidenceSet> EvidenceEnumerator::next()
    {
        if (exhausted)
        {
            return std::nullopt;
        }
        if (options.maxArguments != 0 && produced >= options.maxArguments)
        {
            return std::nullopt;
        }

        while (!stack.empty())
        {
            int top = static_cast<int>(stack.size()) - 1;
            Frame &frame = stack[top];

            if (frame.kind == FrameKind::LITERAL)
            {
                const Case &c = kb.getCase(frame.id);
                const auto &clauses = c.getAssertingClauses();
                const auto &rules = c.getAssertingRules();

                if (frame.clauseCursor < clauses.size())
                {
                    EvidenceSet base;
                    base.addClause(clauses[frame.clauseCursor++]);
                    // deliver 可能压栈，之后不能再使用 frame
                    auto result = deliver(std::move(base), frame.parent, frame.level);
                    if (result && accept(*result))
                    {
                        return result;
                    }
                    continue;
                }
                if (frame.ruleCursor < rules.size())
                {
                    int rule = rules[frame.ruleCursor++];
                    pushRuleFrame(rule, top);
                    continue;
                }
                stack.pop_back();
                continue;
            }

            // 规则帧只在开始时或者所有子帧都结束后位于栈顶
            if (frame.started)
            {
                stack.pop_back();
                continue;
            }
            frame.started = true;

            const auto &body = kb.getRuleBodyIds(frame.id);
            if (body.empty())
            {
                throw std::logic_error("EvidenceEnumerator: rule " + std::to_string(frame.id) + " has an empty body");
            }
            bool cyclic = std::any_of(body.begin(), body.end(),
                                      [this, top](int lit)
                                      { return isExpanding(top, lit); });
            if (cyclic)
            {
                // 前件依赖正在展开的文字，不产生证据集
                stack.pop_back();
                continue;
            }
            frame.partial.assign(body.size(), EvidenceSet());
            pushLiteralFrame(body[0], top, 0);
        }

        exhausted = true;
        return std::nullopt;
    }

    // 把子帧产生的证据集交给父帧
    // 规则帧收到第 level 个前件的证据集后，要么开始枚举下一个前件，要么组合完成继续向下传递
    std::optional<EvidenceSet> EvidenceEnumerator::deliver(EvidenceSet value, int target, size_t level)
    {
        while (target >= 0)
        {
            Frame &frame = stack[target];
            if (frame.kind == FrameKind::LITERAL)
            {
                level = frame.level;
                target = frame.parent;
                continue;
            }

            const auto &body = kb.getRuleBodyIds(frame.id);
            if (level >= frame.partial.size())
            {
                throw std::logic_error("EvidenceEnumerator: body position out of range for rule " +
                                       std::to_string(frame.id));
            }
            value.merge(frame.partial[level]);
            if (level + 1 < body.size())
            {
                frame.partial[level + 1] = std::move(value);
                pushLiteralFrame(body[level + 1], target, level + 1);
                return std::nullopt;
            }
            value.addRule(frame.id);
            level = frame.level;
            target = frame.parent;
        }
        return value;
    }

    // 沿父帧链查找路径上的文字帧
    bool EvidenceEnumerator::isExpanding(int frame, int literal) const
    {
        for (int index = frame; index >= 0; index = stack[index].parent)
        {
            if (stack[index].kind == FrameKind::LITERAL && stack[index].id == literal)
            {
                return true;
            }
        }
        return false;
    }

    bool EvidenceEnumerator::accept(const EvidenceSet &value)
    {
        if (options.deduplicate && !seen.insert(value).second)
        {
            return false;
        }
        ++produced;
        return true;
    }

    std::vector<EvidenceSet> EvidenceEnumerator::collect()
    {
        std::vector<EvidenceSet> result;
        while (auto evidence = next())
        {
            result.push_back(std::move(*evidence));
        }
        return result;
    }
}
