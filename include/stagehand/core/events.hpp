#pragma once

#include "stagehand/core/types.hpp"

#include <nlohmann/json.hpp>
#include <ostream>
#include <streambuf>
#include <string>

namespace stagehand::core {

using json = nlohmann::json;

// Writes one JSON object per line. Every event carries type, run_id and ts.
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());
    void run_stop_requested(int signal, int deliveries);

    void stage_start(const std::string& stage, size_t index, size_t total);
    void stage_end(const std::string& stage, const std::string& status, double seconds);

    void step_start(const std::string& key, const std::string& decision, const json& extra = json::object());
    void step_end(const std::string& key, const std::string& status, const json& extra = json::object());
    void step_skipped(const std::string& key, const std::string& reason);

    void warning(const std::string& message, const json& extra = json::object());
    void error(const std::string& message);

private:
    void emit(const std::string& type, const json& data);
    json base_event(const std::string& type) const;
    void write(const json& event);

    std::string run_id_;
    std::ostream* out_;
};

// Duplicates every character into two stream buffers, e.g. stdout and the
// events log. Either side may be null.
class TeeBuf : public std::streambuf {
public:
    TeeBuf(std::streambuf* a, std::streambuf* b);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* a_;
    std::streambuf* b_;
};

} // namespace stagehand::core
