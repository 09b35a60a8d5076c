// EvidenceEnumerator.h
#ifndef ARGUMENT_SYSTEM_EVIDENCE_ENUMERATOR_H
#define ARGUMENT_SYSTEM_EVIDENCE_ENUMERATOR_H

#include "Argument.h"
#include <vector>
#include <set>
#include <optional>

namespace ArgumentSystem
{
    class KnowledgeBase;

    struct EvidenceOptions
    {
        // 不同推导路径得到相同集合时只输出一次
        bool deduplicate = false;
        // 最多输出多少个证据集，0 表示不限
        size_t maxArguments = 0;
    };

    /*
     * 对一个文字做深度优先的反向链接，惰性地逐个产生证据集。
     *
     * - 每个断言子句 c 产生 {c}
     * - 每条断言规则 r 对前件中每个不同文字取一个证据集做笛卡尔积，
     *   每个组合求并后加入 r
     *
     * 用显式栈代替递归。从规则帧沿父帧链向上就是当前路径上正在展开的文字，
     * 规则前件中出现正在展开的文字时该规则不产生任何证据集，
     * 因此 p :- q. q :- p. 这样的环一定终止。
     *
     * 枚举器只读知识库，所有状态都在自身内部，
     * 同一个知识库上可以同时运行多个枚举器。
     */
    class EvidenceEnumerator
    {
    public:
        EvidenceEnumerator(const KnowledgeBase &kb, int literalId,
                           const EvidenceOptions &options = EvidenceOptions());

        // 下一个证据集，枚举结束返回 std::nullopt
        std::optional<EvidenceSet> next();

        // 从头开始重新枚举
        void reset();

        // 取出剩余的全部证据集（受 maxArguments 限制）
        std::vector<EvidenceSet> collect();

        int getLiteralId() const { return literalId; }
        size_t getProducedCount() const { return produced; }
        size_t getMaxStackDepth() const { return maxStackDepth; }

    private:
        enum class FrameKind
        {
            LITERAL,
            RULE
        };

        struct Frame
        {
            FrameKind kind;
            int id;       // 文字 id 或规则 id
            int parent;   // 栈中父帧下标，根帧为 -1
            size_t level; // 文字帧在父规则前件中的位置

            // 文字帧
            size_t clauseCursor = 0;
            size_t ruleCursor = 0;

            // 规则帧
            bool started = false;
            std::vector<EvidenceSet> partial; // partial[i] 为前件 0..i-1 所选证据集的并
        };

        const KnowledgeBase &kb; // 不拥有，知识库须在枚举期间存活
        int literalId;
        EvidenceOptions options;

        std::vector<Frame> stack;
        std::set<EvidenceSet> seen;
        size_t produced = 0;
        size_t maxStackDepth = 0;
        bool exhausted = false;

        void pushLiteralFrame(int literal, int parent, size_t level);
        void pushRuleFrame(int rule, int parent);
        std::optional<EvidenceSet> deliver(EvidenceSet value, int target, size_t level);
        bool accept(const EvidenceSet &value);
        bool isExpanding(int frame, int literal) const;
    };
}

#endif // ARGUMENT_SYSTEM_EVIDENCE_ENUMERATOR_H
