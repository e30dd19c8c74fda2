// ==============================================================================
// config.cpp - Загрузка схем из YAML (yaml-cpp)
// ==============================================================================

#include "duet/config.hpp"

#include "duet/platform.hpp"

#include <fstream>
#include <yaml-cpp/yaml.h>

namespace duet {

namespace {

/// YAML scalar / mapping -> Value для вложенных default object полей
Value value_from_yaml(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return Value();
    }
    if (node.IsMap()) {
        Composite obj;
        for (const auto& item : node) {
            obj[item.first.as<std::string>()] = value_from_yaml(item.second);
        }
        return Value(std::move(obj));
    }
    if (node.IsSequence()) {
        throw SchemaError("sequences are not supported as field values");
    }

    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return Value(number);
    }
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return Value(flag);
    }
    return Value(node.as<std::string>());
}

/// Default значение поля по его типу
Value default_from_yaml(FieldKind kind, const YAML::Node& node, const std::string& id) {
    switch (kind) {
    case FieldKind::Text:
        return Value(node.as<std::string>());
    case FieldKind::Number:
        return Value(node.as<double>());
    case FieldKind::Boolean:
        return Value(node.as<bool>());
    case FieldKind::Enum:
        return Value::make_enum(node.as<std::string>());
    case FieldKind::Date:
        if (auto t = try_from_epoch_seconds(node.as<double>())) {
            return Value(*t);
        }
        throw SchemaError("field '" + id + "': date default is out of range");
    case FieldKind::Object:
        if (!node.IsMap()) {
            throw SchemaError("field '" + id + "': object default must be a mapping");
        }
        return value_from_yaml(node);
    }
    return Value();
}

/// Разобрать одно объявление поля
Field parse_field(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        throw SchemaError("field #" + std::to_string(index + 1) + " is not a mapping");
    }
    if (!node["id"]) {
        throw SchemaError("field #" + std::to_string(index + 1) + " missing 'id'");
    }

    Field field;
    field.id = node["id"].as<std::string>();
    field.label = node["label"] ? node["label"].as<std::string>() : field.id;

    std::string type_name = node["type"] ? node["type"].as<std::string>() : "text";
    auto kind = parse_field_kind(type_name);
    if (!kind) {
        throw SchemaError("field '" + field.id + "': unknown type '" + type_name + "'");
    }

    switch (*kind) {
    case FieldKind::Text:
        field.type = TextType{};
        break;
    case FieldKind::Number: {
        NumberType number;
        if (node["min"]) {
            number.min = node["min"].as<double>();
        }
        if (node["max"]) {
            number.max = node["max"].as<double>();
        }
        field.type = number;
        break;
    }
    case FieldKind::Boolean:
        field.type = BooleanType{};
        break;
    case FieldKind::Enum: {
        EnumType enumeration;
        if (node["options"] && node["options"].IsSequence()) {
            for (const auto& option : node["options"]) {
                enumeration.options.push_back(option.as<std::string>());
            }
        }
        field.type = std::move(enumeration);
        break;
    }
    case FieldKind::Date:
        field.type = DateType{};
        break;
    case FieldKind::Object:
        field.type = ObjectType{};
        break;
    }

    if (node["default"] && !node["default"].IsNull()) {
        field.default_value = default_from_yaml(*kind, node["default"], field.id);
    }
    if (node["required"]) {
        field.required = node["required"].as<bool>();
    }
    return field;
}

SchemaLoadResult parse_root(const YAML::Node& root) {
    SchemaLoadResult result;
    result.ok = false;

    if (!root.IsMap()) {
        result.error = "schema file must be a mapping";
        return result;
    }
    if (!root["fields"] || !root["fields"].IsSequence()) {
        result.error = "schema file missing 'fields' list";
        return result;
    }

    std::string name = root["name"] ? root["name"].as<std::string>() : "Untitled";

    std::vector<Field> fields;
    std::size_t index = 0;
    for (const auto& node : root["fields"]) {
        fields.push_back(parse_field(node, index++));
    }

    result.schema = std::make_shared<const Schema>(std::move(name), std::move(fields));
    result.ok = true;
    return result;
}

}  // namespace

SchemaLoadResult load_schema_file(const std::filesystem::path& path) {
    SchemaLoadResult result;
    result.ok = false;

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            result.error = "cannot open schema file: " + platform::path_to_utf8(path);
            return result;
        }
        return parse_root(YAML::Load(file));
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
    } catch (const SchemaError& e) {
        result.error = std::string("invalid schema: ") + e.what();
    }
    return result;
}

SchemaLoadResult parse_schema_yaml(std::string_view text) {
    SchemaLoadResult result;
    result.ok = false;

    try {
        return parse_root(YAML::Load(std::string(text)));
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
    } catch (const SchemaError& e) {
        result.error = std::string("invalid schema: ") + e.what();
    }
    return result;
}

// ----------------------------------------------------------------------------
// Встроенные схемы
// ----------------------------------------------------------------------------

std::shared_ptr<const Schema> budget_schema() {
    static const auto schema = std::make_shared<const Schema>(
        "Monthly Budget",
        std::vector<Field>{
            Field::number("income", "Monthly Income", 5000.0, 0.0, 1000000.0),
            Field::number("rent", "Rent", 1500.0, 0.0),
            Field::number("groceries", "Groceries", 400.0, 0.0),
            Field::number("utilities", "Utilities", 150.0, 0.0),
            Field::number("savings", "Savings Goal", 500.0, 0.0),
            Field::boolean("autoSave", "Auto-transfer to savings", true),
            Field::enumeration("priority", "Savings Priority", {"low", "medium", "high"},
                               std::string("medium")),
        });
    return schema;
}

std::shared_ptr<const Schema> fitness_schema() {
    static const auto schema = std::make_shared<const Schema>(
        "Fitness Tracker",
        std::vector<Field>{
            Field::number("targetCalories", "Daily Calorie Target", 2000.0, 1000.0, 5000.0),
            Field::number("proteinGoal", "Protein Goal (g)", 150.0, 0.0, 500.0),
            Field::number("stepsGoal", "Daily Steps Goal", 10000.0, 0.0),
            Field::enumeration("activityLevel", "Activity Level",
                               {"sedentary", "light", "moderate", "active", "very_active"}),
            Field::boolean("trackWater", "Track Water Intake", true),
        });
    return schema;
}

std::shared_ptr<const Schema> builtin_schema(std::string_view name) {
    if (name == "budget") {
        return budget_schema();
    }
    if (name == "fitness") {
        return fitness_schema();
    }
    return nullptr;
}

}  // namespace duet
