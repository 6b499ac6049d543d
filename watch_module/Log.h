#pragma once

#include <string>

// Общий лог для всех потоков сайтов.
// Строка пишется целиком под одним мьютексом, чтобы вывод разных сайтов не перемешивался.

void logInfo(const std::string& tag, const std::string& text);
void logError(const std::string& tag, const std::string& text);

// Подробный режим (размер батча, движение курсора)
void setVerbose(bool on);
void logDebug(const std::string& tag, const std::string& text);

// Сырая строка в stdout (без тега) под тем же мьютексом
void writeStdoutLine(const std::string& line);
