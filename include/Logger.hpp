#include <string>
#ifndef LOGGER_HPP
#define LOGGER_HPP

class Logger {
    public:
        Logger(std::string sessionID, std::string logDir = "logs", bool echo = true);
        ~Logger();
        void logRequest(std::string request); //Log the request and timestamp
        void logResponse(std::string response); //Log the response and timestamp
        void logConnectionOpened(std::string host, int port); //Log control connection opening
        void logConnectionClosed(std::string host, int port); //Log control connection closure
        void logListening(int port); //Log data listener start
        void logStateChange(std::string from, std::string to); //Log session state transition
        void logError(std::string entry); //Log failure, always echoed to stderr
        void logCustomMsg(std::string entry); //Log custom message
        std::string logFilePath() const;
    private:
        std::string sessionID;
        std::string logDir;
        bool echo;
        const std::string getTime();
        void logToFile(std::string entry);
};

#endif // LOGGER_HPP
