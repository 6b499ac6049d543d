#pragma once

#include <string>

// Куда уходит строка на каждое сообщение
class ConsoleOutput {
public:
    virtual ~ConsoleOutput() = default;
    virtual void printLine(const std::string& line) = 0;
};

class StdoutConsole : public ConsoleOutput {
public:
    void printLine(const std::string& line) override;
};

// Уведомление о важном сообщении
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& summary, const std::string& body) = 0;
};

// notify-send через posix_spawnp. Бросает NotifyError.
class DesktopNotifier : public Notifier {
public:
    explicit DesktopNotifier(std::string program = "notify-send");
    void notify(const std::string& summary, const std::string& body) override;

private:
    std::string program;
};

// "notifications": false -> только строка в лог
class LogNotifier : public Notifier {
public:
    void notify(const std::string& summary, const std::string& body) override;
};
