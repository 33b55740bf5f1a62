#pragma once

#include "condition_tree.hpp"
#include "datatypes.hpp"
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace indicators { class IndicatorCache; }

namespace strategy_engine {

    // IF_THEN: idle (armed == false) or armed since triggered_at
    struct IfThenState {
        bool armed = false;
        std::size_t triggered_at = 0;
    };

    // SEQUENCE: next step to satisfy and the bar at which the previous step completed
    struct SequenceState {
        std::size_t next_step = 0;
        std::optional<std::size_t> last_completed_at;
    };

    // Leaves and stateless groups hold std::monostate
    using NodeState = std::variant<std::monostate, IfThenState, SequenceState>;

    // Mutable state of the stateful operators for one run over one bar series.
    // Indexed by NodeId of the tree it was created for; never shared between runs.
    class EvaluationState {
    public:
        explicit EvaluationState(const ConditionTree& tree);

        // Back to the initial (idle / step 0) state for every node
        void reset();

        IfThenState& ifThen(NodeId id);     // throws std::logic_error if the node is not IF_THEN
        SequenceState& sequence(NodeId id); // throws std::logic_error if the node is not SEQUENCE

        std::size_t size() const { return states_.size(); }

    private:
        std::vector<NodeState> states_;
    };

    // Everything one evaluation step needs, passed explicitly down the recursion
    struct EvaluationContext {
        const core::TimeSeries<core::Candle>& bars;
        std::size_t current_index;
        indicators::IndicatorCache& cache;
        EvaluationState& state;
    };

} // namespace strategy_engine
