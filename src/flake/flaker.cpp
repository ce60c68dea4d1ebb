#include "flakelib/flake/flaker.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "flakelib/error.hpp"
#include "flakelib/flake/bit_utils.hpp"
#include "flakelib/utils/log_config.hpp"

namespace flakelib::flake {

Flaker::Flaker(const WorkerId& identifier, std::shared_ptr<Clock> clock, SequencePolicy policy)
    : identifier_(identifier),
      policy_(policy),
      clock_(std::move(clock)),
      logger_(utils::LogManager::instance().get_logger("flakelib.flaker")) {
    last_generated_time_ms_ = clock_->now_ms();
}

Result<Flaker> Flaker::create(const WorkerId& identifier, Endianness endianness,
                              std::shared_ptr<Clock> clock, SequencePolicy policy) {
    WorkerId stored = identifier;
    if (endianness == Endianness::Big) {
        reverse_bytes(stored);
    }
    if (!clock) {
        clock = std::make_shared<SystemClock>();
    }
    Flaker flaker(stored, std::move(clock), policy);
    if (flaker.logger_->should_log(utils::LogLevel::Debug)) {
        flaker.logger_->log_with_metadata(utils::LogLevel::Debug, "flaker created",
            {{"worker_id", format_worker_id(flaker.identifier_)},
             {"endianness", endianness_to_string(endianness)},
             {"sequence_policy", sequence_policy_to_string(policy)},
             {"start_ms", std::to_string(flaker.last_generated_time_ms_)}},
            __FILE__, __LINE__);
    }
    return flaker;
}

Result<Flaker> Flaker::create(std::span<const uint8_t> identifier, Endianness endianness,
                              std::shared_ptr<Clock> clock, SequencePolicy policy) {
    if (identifier.size() != kWorkerIdSize) {
        return make_error_code(FlakeErrc::invalid_identifier);
    }
    WorkerId id{};
    std::copy(identifier.begin(), identifier.end(), id.begin());
    return create(id, endianness, std::move(clock), policy);
}

Result<Flaker> Flaker::from_identifier(std::span<const uint8_t> identifier, std::shared_ptr<Clock> clock) {
    if (identifier.size() < kWorkerIdSize) {
        return make_error_code(FlakeErrc::invalid_identifier);
    }
    return create(identifier.first(kWorkerIdSize), Endianness::Little, std::move(clock));
}

std::error_code Flaker::update() {
    if (!clock_) {
        return make_error_code(FlakeErrc::moved_from);
    }
    uint64_t now_ms = clock_->now_ms();

    if (last_generated_time_ms_ > now_ms) {
        FLAKELIB_LOG_WARNING(logger_, "clock is running backwards: last=" + std::to_string(last_generated_time_ms_) +
                                      "ms now=" + std::to_string(now_ms) + "ms");
        return make_error_code(FlakeErrc::clock_is_running_backwards);
    }

    if (last_generated_time_ms_ < now_ms) {
        counter_ = 0;
    } else {
        if (counter_ == std::numeric_limits<uint16_t>::max() && policy_ == SequencePolicy::Reject) {
            FLAKELIB_LOG_WARNING(logger_, "sequence exhausted at " + std::to_string(now_ms) + "ms");
            return make_error_code(FlakeErrc::sequence_exhausted);
        }
        counter_ = static_cast<uint16_t>(counter_ + 1);
    }

    last_generated_time_ms_ = now_ms;
    return {};
}

FlakeId Flaker::construct_id() const {
    FlakeFields fields;
    fields.timestamp_ms = last_generated_time_ms_;
    fields.worker_id = identifier_;
    fields.sequence = counter_;
    return pack_id(fields);
}

Result<FlakeId> Flaker::get_id() {
    if (auto ec = update()) {
        return ec;
    }
    return construct_id();
}

Result<std::vector<FlakeId>> Flaker::get_ids(size_t n) {
    std::vector<FlakeId> ids;
    ids.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        auto id = get_id();
        if (!id) return id.error();
        ids.push_back(std::move(id).value());
    }
    return ids;
}

std::string sequence_policy_to_string(SequencePolicy policy) {
    return policy == SequencePolicy::Reject ? "reject" : "wrap";
}

Result<SequencePolicy> parse_sequence_policy(std::string_view text) {
    if (text == "wrap") return SequencePolicy::Wrap;
    if (text == "reject") return SequencePolicy::Reject;
    return make_error_code(FlakeErrc::invalid_config);
}

} // namespace flakelib::flake
