// ==============================================================================
// duet/config.hpp - Загрузка схем из YAML и встроенные схемы
// ==============================================================================
//
// Формат файла схемы:
//
//   name: Monthly Budget
//   fields:
//     - id: income
//       label: Monthly Income       # по умолчанию = id
//       type: number                # text|number|boolean|enum|date|object
//       default: 5000
//       min: 0
//       max: 1000000
//       required: true
//     - id: priority
//       type: enum
//       options: [low, medium, high]
//       default: medium
//
// Default для date задаётся в epoch seconds, для object это YAML mapping.
//
// ==============================================================================

#ifndef DUET_CONFIG_HPP
#define DUET_CONFIG_HPP

#include <duet/schema.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace duet {

/// Результат загрузки схемы
struct SchemaLoadResult {
    bool ok = false;
    std::shared_ptr<const Schema> schema;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Загрузить схему из YAML файла
SchemaLoadResult load_schema_file(const std::filesystem::path& path);

/// Разобрать схему из YAML текста
SchemaLoadResult parse_schema_yaml(std::string_view text);

// ----------------------------------------------------------------------------
// Встроенные схемы
// ----------------------------------------------------------------------------

/// Monthly Budget: income, rent, groceries, utilities, savings, autoSave, priority
std::shared_ptr<const Schema> budget_schema();

/// Fitness Tracker: targetCalories, proteinGoal, stepsGoal, activityLevel, trackWater
std::shared_ptr<const Schema> fitness_schema();

/// Встроенная схема по имени ("budget" / "fitness"), nullptr если имя неизвестно
std::shared_ptr<const Schema> builtin_schema(std::string_view name);

}  // namespace duet

#endif  // DUET_CONFIG_HPP
