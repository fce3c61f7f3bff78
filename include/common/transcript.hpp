/*
 * File: include/common/transcript.hpp
 * Project: Transcript Relay
 * Purpose: Transcript payload model and its JSON wire form
 * Notes:
 *  - Wire shape is fixed by the receiving webhook: meeting_id, title,
 *    transcript, attendees, stage
 *  - attendees is always an empty array
 * Last updated: 2026-10-18
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


struct TranscriptPayload
{
    std::string meeting_id;
    std::string title;
    std::string transcript;
    std::vector<std::string> attendees;
    bool stage = true;
};


// meeting_id is the file's base name with the last extension stripped
inline std::string meeting_id_for(const std::filesystem::path &file)
{
    return file.stem().string();
}


inline TranscriptPayload make_payload(const std::filesystem::path &file, std::string text, bool stage)
{
    TranscriptPayload p;
    p.meeting_id = meeting_id_for(file);
    p.title = p.meeting_id;
    p.transcript = std::move(text);
    p.stage = stage;
    return p;
}


inline nlohmann::json payload_to_json(const TranscriptPayload &p)
{
    using nlohmann::json;
    return json{
        {"meeting_id", p.meeting_id},
        {"title", p.title},
        {"transcript", p.transcript},
        {"attendees", p.attendees},
        {"stage", p.stage}};
}


// Throws nlohmann::json::type_error when the transcript is not valid UTF-8.
inline std::string payload_body(const TranscriptPayload &p)
{
    return payload_to_json(p).dump();
}
