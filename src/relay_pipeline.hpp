/*
 * File: src/relay_pipeline.hpp
 * Project: Transcript Relay
 * Purpose: Read, POST and archive one stable transcript
 * Notes:
 *  - Unreadable files and delivered files go into the seen set
 *  - Transport errors and non-2xx responses leave the file for the next cycle
 *  - A 2xx whose archive move fails is still marked seen: no re-send of an
 *    acknowledged transcript
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "atomic_move.hpp"
#include "common/transcript.hpp"
#include "relay_fs.hpp"
#include "relay_http.hpp"
#include "relay_log.hpp"
#include "relay_state.hpp"

enum class DeliveryOutcome
{
    Delivered,
    DeliveredNotArchived,
    Unreadable,
    TransportError,
    Rejected
};

inline const char *to_string(DeliveryOutcome o)
{
    switch (o)
    {
    case DeliveryOutcome::Delivered:
        return "delivered";
    case DeliveryOutcome::DeliveredNotArchived:
        return "delivered-not-archived";
    case DeliveryOutcome::Unreadable:
        return "unreadable";
    case DeliveryOutcome::TransportError:
        return "transport-error";
    case DeliveryOutcome::Rejected:
        return "rejected";
    }
    return "unknown";
}

using Clock = std::function<std::chrono::system_clock::time_point()>;

class DeliveryPipeline
{
    WebhookTransport &transport_;
    fs::path archive_dir_;
    bool stage_;
    RelayState &state_;
    Clock now_;

public:
    DeliveryPipeline(WebhookTransport &transport, fs::path archive_dir, bool stage, RelayState &state, Clock clock = {})
        : transport_(transport), archive_dir_(std::move(archive_dir)), stage_(stage), state_(state),
          now_(clock ? std::move(clock) : Clock([]
                                                { return std::chrono::system_clock::now(); })) {}

    DeliveryOutcome deliver(const fs::path &file)
    {
        const std::string key = file.string();
        log_info("found transcript file: ", key);

        std::string text;
        if (!read_file_all(file, text))
        {
            log_error("failed to read ", key, ", skipping it for the rest of this run");
            return mark_unreadable(key);
        }
        normalize_newlines(text);

        TranscriptPayload payload = make_payload(file, std::move(text), stage_);
        std::string body;
        try
        {
            body = payload_body(payload);
        }
        catch (const nlohmann::json::exception &e)
        {
            log_error("cannot encode ", key, " as JSON (", e.what(), "), skipping it for the rest of this run");
            return mark_unreadable(key);
        }

        WebhookResponse resp;
        try
        {
            resp = transport_.post_json(body);
        }
        catch (const std::exception &e)
        {
            ++state_.stats.transport_errors;
            log_error("failed to POST transcript for ", payload.meeting_id, " (", body.size(),
                      " bytes): ", e.what(), "; will retry");
            return DeliveryOutcome::TransportError;
        }

        if (!resp.ok())
        {
            ++state_.stats.rejected;
            log_warn("webhook returned non-2xx for ", payload.meeting_id, ": ", resp.status, " ", resp.body, "; will retry");
            return DeliveryOutcome::Rejected;
        }

        log_info("posted transcript for ", payload.meeting_id, " -> ", transport_.describe(), " (status=", resp.status, ")");
        ++state_.stats.delivered;
        state_.seen.insert(key);
        return archive(file, payload.meeting_id);
    }

private:
    DeliveryOutcome mark_unreadable(const std::string &key)
    {
        ++state_.stats.unreadable;
        state_.seen.insert(key);
        return DeliveryOutcome::Unreadable;
    }

    DeliveryOutcome archive(const fs::path &file, const std::string &meeting_id)
    {
        try
        {
            ensure_dir(archive_dir_);
            const fs::path dst = archive_destination(archive_dir_, meeting_id, now_());
            move_atomic(file, dst);
            log_info("moved processed file to ", dst.string());
            return DeliveryOutcome::Delivered;
        }
        catch (const std::exception &e)
        {
            ++state_.stats.archive_anomalies;
            log_error("delivered ", file.string(), " but failed to archive it: ", e.what(),
                      "; it stays in place and will not be re-sent this run");
            return DeliveryOutcome::DeliveredNotArchived;
        }
    }
};
