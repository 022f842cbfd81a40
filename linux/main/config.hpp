#pragma once

// Последовательный порт (лифт ↔ монитор): 9600 bps, 8 бит, even, 1 стоп-бит
#define UART_DEFAULT_DEVICE "/dev/ttyUSB0"

// Тег для логов
#define LOG_TAG_MONITOR "monitor"
#define LOG_TAG_SIMULATOR "simulator"

// Отладка: HEX/ASCII-дамп принятых байт
#define DEBUG_DUMP_RX 1

// Общий конфиг (переиспользуемые таймауты/дефолты).
#include "../../common/config_common.hpp"
