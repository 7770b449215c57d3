#include "Logger.hpp"
#include "Protocol.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>

#include <filesystem>   
#include <fstream>      
#include <mutex> 

#include <algorithm>
#include <string>
#include <utility>

// Serialize concurrent file writes across all Logger instances
static std::mutex g_log_file_mutex;

// Sanitize a log line (trim at first CR/LF, keep printable ASCII/whitespace, cap length)
static std::string sanitize_line(std::string s) {
    // Trim at first line break
    if (auto p = s.find_first_of("\r\n"); p != std::string::npos)
        s.erase(p);

    // Keep only printable ASCII and tab
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
        // drop other control/binary (NUL padding from server frames)
    }

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}

// Payload preview: line breaks become spaces, other control/binary bytes are dropped
static std::string flatten_payload(const std::string& s, size_t limit) {
    std::string out;
    out.reserve(std::min(s.size(), limit));
    for (unsigned char c : s.substr(0, limit)) {
        if (c == '\n' || c == '\r' || c == '\t')
            out.push_back(' ');
        else if (c >= 32 && c <= 126)
            out.push_back(static_cast<char>(c));
    }
    return out;
}


// Create a new logger object for the given session
Logger::Logger(std::string sessionID, std::string logDir, bool echo)
    : sessionID(std::move(sessionID)), logDir(std::move(logDir)), echo(echo) {
    // Ensure the logs directory exists (safe if it already exists)
    std::error_code ec;
    std::filesystem::create_directories(this->logDir, ec);
}

Logger::~Logger(){
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

std::string Logger::logFilePath() const {
    return (std::filesystem::path(logDir) / "log.txt").string();
}

void Logger::logRequest(std::string request){
    const std::string clean = sanitize_line(request);
    logToFile(getTime() + " [" + this->sessionID + "]: Request: " + clean);
}

void Logger::logResponse(std::string response){
    // Same bytes the server is guaranteed to send
    const std::string preview = flatten_payload(response, Protocol::MIN_RESPONSE_SIZE);
    const std::string clean = flatten_payload(response, 512);

    std::string log = getTime() + " [" + this->sessionID + "]: Response: " + clean;
    if (echo) std::cout << "received response: " << preview << std::endl;
    logToFile(log);
}

void Logger::logConnectionOpened(std::string host, int port){
    if (echo) std::cout << "Connection established with server on port: " << port << std::endl;
    logToFile(getTime() + " [" + this->sessionID + "]: Connection opened to " + host + ":" + std::to_string(port));
}

void Logger::logConnectionClosed(std::string host, int port){
    logToFile(getTime() + " [" + this->sessionID + "]: Connection closed for " + host + ":" + std::to_string(port));
}

void Logger::logListening(int port){
    if (echo) std::cout << "Listening for data connections on port: " << port << std::endl;
    logToFile(getTime() + " [" + this->sessionID + "]: Listening on data port " + std::to_string(port));
}

void Logger::logStateChange(std::string from, std::string to){
    logToFile(getTime() + " [" + this->sessionID + "]: State " + from + " -> " + to);
}

void Logger::logError(std::string entry){
    const std::string clean = sanitize_line(entry);
    std::cerr << "Error: " << clean << std::endl;
    logToFile(getTime() + " [" + this->sessionID + "]: ERROR: " + clean);
}

void Logger::logCustomMsg(std::string entry){
    logToFile(getTime() + " [" + this->sessionID + "]: " + sanitize_line(entry));
}


void Logger::logToFile(std::string entry){
    // One log file shared by every session
    const std::string logfile = logFilePath();
    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    std::ofstream out(logfile, std::ios::app); //Open in append mode
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << logfile << "\n";
        return;
    }
    out << entry << '\n';
    //std::ofstream flushed on destruction; explicit flush not required.
}
