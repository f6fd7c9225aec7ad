// Catch2 v2: main из библиотеки заголовков. Для v3 этот файл не собирается (Catch2WithMain).
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
