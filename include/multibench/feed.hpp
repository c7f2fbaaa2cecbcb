/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "multibench/config.hpp"
#include "multibench/types.hpp"

namespace multibench {

// Source of problems for one run. Each problem arrives already encoded as
// the tokens that go between the program path and the pass-through tokens.
class ProblemFeed {
public:
    virtual ~ProblemFeed() = default;

    // std::nullopt once the feed is exhausted.
    [[nodiscard]] virtual std::optional<Tokens> next() = 0;
};

// Exactly one problem; its parameters travel as pass-through tokens.
class SingleProblemFeed final : public ProblemFeed {
public:
    [[nodiscard]] std::optional<Tokens> next() override;

private:
    bool done_ = false;
};

// One opaque value per line, sent as "--<argString> <value>".
class LineProblemFeed final : public ProblemFeed {
public:
    LineProblemFeed(std::unique_ptr<std::istream> input, std::string argString);

    // Throws InputValidationError if the file cannot be opened.
    [[nodiscard]] static std::unique_ptr<LineProblemFeed> open(const std::filesystem::path& path,
                                                               const std::string& argString);

    [[nodiscard]] std::optional<Tokens> next() override;

private:
    std::unique_ptr<std::istream> input_;
    std::string flag_;
};

using SchemaRow = std::vector<std::pair<std::string, std::string>>;

// Whitespace-separated rows whose columns are named by a schema, sent as
// "--<name> <value>" pairs in schema order. The whole input is validated
// on construction so a bad row stops the run before any problem starts.
class SchemaProblemFeed final : public ProblemFeed {
public:
    SchemaProblemFeed(std::istream& input, std::vector<std::string> schema, const std::string& source = "<input>");

    [[nodiscard]] static std::unique_ptr<SchemaProblemFeed> open(const std::filesystem::path& path,
                                                                 const std::vector<std::string>& schema);

    [[nodiscard]] std::optional<Tokens> next() override;
    [[nodiscard]] std::size_t remaining() const noexcept { return rows_.size() - cursor_; }

    // Pairs the tokens of one line with the schema. std::nullopt for blank
    // and comment-only lines; InputValidationError on a token count mismatch.
    [[nodiscard]] static std::optional<SchemaRow> parseRow(const std::string& line,
                                                           const std::vector<std::string>& schema,
                                                           std::size_t lineNumber = 0,
                                                           const std::string& source = "<input>");

private:
    std::vector<std::string> schema_;
    std::vector<SchemaRow> rows_;
    std::size_t cursor_ = 0;
};

// Everything before the first '#', with surrounding whitespace removed.
[[nodiscard]] std::string stripComment(const std::string& line);
[[nodiscard]] Tokens splitWhitespace(const std::string& text);

// Feed for the given entry point, opened from config.inputFile when needed.
[[nodiscard]] std::unique_ptr<ProblemFeed> makeFeed(EntryPoint entry, const Config& config);

}
