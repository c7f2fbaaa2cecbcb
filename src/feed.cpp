/*
 * multibench - Contention-aware benchmark orchestration
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "multibench/feed.hpp"
#include "multibench/config.hpp"
#include "multibench/errors.hpp"
#include "multibench/logger.hpp"
#include <cctype>
#include <fstream>
#include <sstream>

namespace multibench {

namespace {
bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::unique_ptr<std::ifstream> openInput(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ifstream>(path);
    if (!*file) {
        throw InputValidationError("Cannot open input file: " + path.string());
    }
    return file;
}
}

std::string stripComment(const std::string& line) {
    std::string body = line.substr(0, line.find('#'));
    std::size_t begin = 0;
    while (begin < body.size() && isSpace(body[begin])) {
        ++begin;
    }
    std::size_t end = body.size();
    while (end > begin && isSpace(body[end - 1])) {
        --end;
    }
    return body.substr(begin, end - begin);
}

Tokens splitWhitespace(const std::string& text) {
    Tokens tokens;
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<Tokens> SingleProblemFeed::next() {
    if (done_) {
        return std::nullopt;
    }
    done_ = true;
    return Tokens{};
}

LineProblemFeed::LineProblemFeed(std::unique_ptr<std::istream> input, std::string argString)
    : input_(std::move(input)), flag_("--" + std::move(argString)) {
}

std::unique_ptr<LineProblemFeed> LineProblemFeed::open(const std::filesystem::path& path,
                                                       const std::string& argString) {
    LOG_DEBUG("Reading problems from " + path.string());
    return std::make_unique<LineProblemFeed>(openInput(path), argString);
}

std::optional<Tokens> LineProblemFeed::next() {
    std::string line;
    while (input_ && std::getline(*input_, line)) {
        std::string value = stripComment(line);
        if (!value.empty()) {
            return Tokens{flag_, value};
        }
    }
    if (input_ && input_->bad()) {
        throw InputValidationError("Read error while reading problems");
    }
    return std::nullopt;
}

SchemaProblemFeed::SchemaProblemFeed(std::istream& input, std::vector<std::string> schema,
                                     const std::string& source)
    : schema_(std::move(schema)) {
    if (schema_.empty()) {
        throw ConfigurationError("Problem schema must name at least one argument");
    }

    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (auto row = parseRow(line, schema_, lineNumber, source)) {
            rows_.push_back(std::move(*row));
        }
    }
    if (input.bad()) {
        throw InputValidationError("Read error in " + source + " after line " + std::to_string(lineNumber));
    }
    LOG_DEBUG("Validated " + std::to_string(rows_.size()) + " problem rows from " + source);
}

std::unique_ptr<SchemaProblemFeed> SchemaProblemFeed::open(const std::filesystem::path& path,
                                                           const std::vector<std::string>& schema) {
    auto file = openInput(path);
    return std::make_unique<SchemaProblemFeed>(*file, schema, path.string());
}

std::optional<Tokens> SchemaProblemFeed::next() {
    if (cursor_ >= rows_.size()) {
        return std::nullopt;
    }
    const SchemaRow& row = rows_[cursor_++];
    Tokens tokens;
    tokens.reserve(row.size() * 2);
    for (const auto& [name, value] : row) {
        tokens.push_back("--" + name);
        tokens.push_back(value);
    }
    return tokens;
}

std::optional<SchemaRow> SchemaProblemFeed::parseRow(const std::string& line,
                                                     const std::vector<std::string>& schema,
                                                     std::size_t lineNumber,
                                                     const std::string& source) {
    Tokens tokens = splitWhitespace(stripComment(line));
    if (tokens.empty()) {
        return std::nullopt;
    }
    if (tokens.size() != schema.size()) {
        throw InputValidationError(source + ":" + std::to_string(lineNumber) + ": expected " +
                                   std::to_string(schema.size()) + " values, found " +
                                   std::to_string(tokens.size()));
    }

    SchemaRow row;
    row.reserve(schema.size());
    for (std::size_t i = 0; i < schema.size(); ++i) {
        row.emplace_back(schema[i], tokens[i]);
    }
    return row;
}

std::unique_ptr<ProblemFeed> makeFeed(EntryPoint entry, const Config& config) {
    switch (entry) {
        case EntryPoint::List:
            return LineProblemFeed::open(config.inputFile, config.problemArgString);
        case EntryPoint::Schema:
            return SchemaProblemFeed::open(config.inputFile, config.problemSchema);
        case EntryPoint::Single:
        default:
            return std::make_unique<SingleProblemFeed>();
    }
}

}
