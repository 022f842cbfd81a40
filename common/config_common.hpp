#pragma once

// Общие параметры, не зависящие от конкретной платформы.
// Подключается из platform config.hpp.

// Скорость последовательного порта, бит/с.
#ifndef UART_BAUD_RATE
#define UART_BAUD_RATE 9600
#endif

// Пауза цикла чтения, если данных нет.
#ifndef MONITOR_POLL_INTERVAL_MS
#define MONITOR_POLL_INTERVAL_MS 10
#endif

// Сообщение «нет данных» не чаще этого интервала.
#ifndef MONITOR_IDLE_WARNING_MS
#define MONITOR_IDLE_WARNING_MS 10000
#endif

// Этаж старта симулятора по умолчанию.
#ifndef SIMULATOR_START_FLOOR
#define SIMULATOR_START_FLOOR 1
#endif
