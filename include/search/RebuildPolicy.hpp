#pragma once
#include <cstddef>

namespace search {

enum class RebuildMode {
    Incremental,     // project new text through the current vocabulary
    PendingRebuild   // next mutation must re-derive the vocabulary
};

const char* rebuild_mode_str(RebuildMode m);

// Decides when the VectorIndex re-derives its vocabulary.
//
// A full rebuild is due when the operation is a batch, when the corpus was
// empty before the operation, or when the count of mutations since the last
// rebuild reaches the threshold. The index asks for a decision before each
// mutation and reports back with mark_rebuilt() / mark_incremental().
class RebuildPolicy {
public:
    explicit RebuildPolicy(size_t threshold = 100);

    // single add/update; returns the mode the operation must run in
    RebuildMode plan_single(bool corpus_was_empty);

    // add_batch always rebuilds
    RebuildMode plan_batch();

    // force the next mutation (or an explicit rebuild) to re-derive
    void request_rebuild();

    void mark_rebuilt();
    void mark_incremental();

    RebuildMode mode() const { return m_mode; }
    size_t pending_ops() const { return m_pending_ops; }
    size_t threshold() const { return m_threshold; }

private:
    size_t m_threshold;
    size_t m_pending_ops = 0;   // incremental mutations since the last rebuild
    RebuildMode m_mode = RebuildMode::PendingRebuild;
};

}
