// File: common/errors.hpp

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace errors {

    class PipelineError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A raw record cannot be attributed to a player. Fatal for the record only.
    class MissingIdentifierError final : public PipelineError {
    public:
        explicit MissingIdentifierError(const std::size_t record_index) :
            PipelineError("Raw record #" + std::to_string(record_index) + " has no player identifier"),
            record_index_(record_index) {}

        [[nodiscard]] std::size_t recordIndex() const noexcept { return record_index_; }

    private:
        std::size_t record_index_;
    };

    // An aggregate lacks a required counting stat. Fatal for the player only.
    class InvalidAggregateError final : public PipelineError {
    public:
        InvalidAggregateError(std::string player_id, std::string stat) :
            PipelineError("Player '" + player_id + "' is missing required stat '" + stat + "'"),
            player_id_(std::move(player_id)), stat_(std::move(stat)) {}

        [[nodiscard]] const std::string &playerId() const noexcept { return player_id_; }
        [[nodiscard]] const std::string &stat() const noexcept { return stat_; }

    private:
        std::string player_id_;
        std::string stat_;
    };

    // The population cannot be clustered at all. Fatal for the whole run.
    class DegenerateInputError final : public PipelineError {
    public:
        using PipelineError::PipelineError;
    };

    class PipelineCancelledError final : public PipelineError {
    public:
        explicit PipelineCancelledError(const std::string &checkpoint) :
            PipelineError("Pipeline cancelled after checkpoint '" + checkpoint + "'") {}
    };

} // namespace errors

#endif // ERRORS_HPP
