//
// Created by WhySkyDie on 21.07.2025.
//

#include <gtest/gtest.h>
#include <gmock/gmock.h>

// ============================================================================
// Главная функция для запуска тестов
// ============================================================================

int main(int argc, char** argv) {
    // Инициализация Google Mock (включает Google Test)
    ::testing::InitGoogleMock(&argc, argv);

    // Настройка вывода
    ::testing::FLAGS_gtest_color = "yes";
    ::testing::FLAGS_gtest_print_time = true;

    // Запуск всех тестов
    return RUN_ALL_TESTS();
}
