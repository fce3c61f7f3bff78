/*
 * File: src/relay_fs.hpp
 * Project: Transcript Relay
 * Purpose: Filesystem helpers shared by the detector and the pipeline
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

inline void ensure_dir(const fs::path &p)
{
    std::error_code ec;
    if (!fs::exists(p, ec))
    {
        fs::create_directories(p, ec);
        if (ec)
            throw std::runtime_error("create_directories failed for " + p.string() + ": " + ec.message());
    }
    else if (!fs::is_directory(p, ec))
    {
        throw std::runtime_error("not a directory: " + p.string());
    }
}

inline bool read_file_all(const fs::path &p, std::string &out)
{
    std::ifstream f(p, std::ios::binary);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad())
        return false;
    out = ss.str();
    return true;
}

// CRLF and lone CR become LF, as a text-mode read would give them
inline void normalize_newlines(std::string &s)
{
    std::string::size_type w = 0;
    for (std::string::size_type r = 0; r < s.size(); ++r)
    {
        if (s[r] == '\r')
        {
            s[w++] = '\n';
            if (r + 1 < s.size() && s[r + 1] == '\n')
                ++r;
        }
        else
        {
            s[w++] = s[r];
        }
    }
    s.resize(w);
}

// case-insensitive ".txt" suffix on the file name
inline bool has_txt_suffix(const std::string &name)
{
    static const std::string ext = ".txt";
    if (name.size() < ext.size())
        return false;
    return std::equal(ext.begin(), ext.end(), name.end() - static_cast<std::ptrdiff_t>(ext.size()),
                      [](char a, char b)
                      { return a == std::tolower(static_cast<unsigned char>(b)); });
}
