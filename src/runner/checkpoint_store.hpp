#pragma once

#include "cells/question_table.hpp"
#include "diagnostics.hpp"

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SkippedQuestion — a question that produced no table, and why
// ---------------------------------------------------------------------------
struct SkippedQuestion {
    std::string code;
    std::string reason;
};

// ---------------------------------------------------------------------------
// FailedItem — a ranking item that could not be tabulated
// ---------------------------------------------------------------------------
struct FailedItem {
    std::string code;
    std::string item;
};

// ---------------------------------------------------------------------------
// Checkpoint — completed tables and the codes already processed (including
// skipped ones, so a resumed run does not retry them), plus the omitted
// tests and failed items of those questions so a resumed run keeps its
// PARTIAL status.
// ---------------------------------------------------------------------------
struct Checkpoint {
    std::vector<std::string> processed;
    std::vector<QuestionTable> tables;
    std::vector<SkippedQuestion> skipped;
    std::vector<SkippedTest> skipped_tests;
    std::vector<FailedItem> failed_items;
};

// ---------------------------------------------------------------------------
// CheckpointStore — abstract persistence for resumable runs
// load() returns nullopt when no checkpoint exists and throws when one exists
// but cannot be read.
// ---------------------------------------------------------------------------
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;
    virtual std::optional<Checkpoint> load() = 0;
    virtual void save(const Checkpoint& checkpoint) = 0;
    virtual void clear() = 0;
};

// ---------------------------------------------------------------------------
// InMemoryCheckpointStore — keeps the last saved checkpoint in memory
// ---------------------------------------------------------------------------
class InMemoryCheckpointStore : public CheckpointStore {
public:
    std::optional<Checkpoint> load() override { return stored_; }

    void save(const Checkpoint& checkpoint) override {
        stored_ = checkpoint;
        ++save_count_;
    }

    void clear() override { stored_.reset(); }

    bool has_checkpoint() const { return stored_.has_value(); }
    int save_count() const { return save_count_; }

private:
    std::optional<Checkpoint> stored_;
    int save_count_ = 0;
};
