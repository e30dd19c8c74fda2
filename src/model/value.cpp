// ==============================================================================
// value.cpp - Реализация Value (значения полей документа)
// ==============================================================================

#include "duet/value.hpp"

#include "duet/platform.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <limits>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace duet {

const char* value_kind_to_string(ValueKind kind) {
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Text:
        return "text";
    case ValueKind::Number:
        return "number";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Enum:
        return "enum";
    case ValueKind::Date:
        return "date";
    case ValueKind::Composite:
        return "object";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Value: тип и доступ
// ----------------------------------------------------------------------------

ValueKind Value::kind() const {
    // Порядок соответствует альтернативам variant
    switch (data_.index()) {
    case 0:
        return ValueKind::Null;
    case 1:
        return ValueKind::Text;
    case 2:
        return ValueKind::Number;
    case 3:
        return ValueKind::Boolean;
    case 4:
        return ValueKind::Enum;
    case 5:
        return ValueKind::Date;
    default:
        return ValueKind::Composite;
    }
}

const std::string* Value::get_string_like() const {
    if (const auto* text = get_text()) {
        return text;
    }
    return get_enum();
}

const Value* Value::get(const std::string& key) const {
    if (const auto* obj = get_composite()) {
        auto it = obj->find(key);
        if (it != obj->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

std::size_t Value::size() const {
    if (const auto* obj = get_composite()) {
        return obj->size();
    }
    return 0;
}

Value Value::with(const std::string& key, Value v) const {
    Composite next;
    if (const auto* obj = get_composite()) {
        next = *obj;
    }
    next[key] = std::move(v);
    return Value(std::move(next));
}

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) {
        return false;
    }

    switch (kind()) {
    case ValueKind::Null:
        return true;
    case ValueKind::Text:
        return as_text() == other.as_text();
    case ValueKind::Number:
        return as_number() == other.as_number();
    case ValueKind::Boolean:
        return as_bool() == other.as_bool();
    case ValueKind::Enum:
        return as_enum() == other.as_enum();
    case ValueKind::Date:
        return as_date() == other.as_date();
    case ValueKind::Composite: {
        const auto& a = std::get<std::shared_ptr<const Composite>>(data_);
        const auto& b = std::get<std::shared_ptr<const Composite>>(other.data_);
        // Общий узел после with() - сравнение без обхода
        if (a == b) {
            return true;
        }
        return *a == *b;
    }
    }
    return false;
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        // Все числовые представления JSON сводятся к double
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsObject()) {
        Composite obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    throw std::invalid_argument("arrays are not supported as field values");
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    switch (kind()) {
    case ValueKind::Null:
        out.SetNull();
        return;

    case ValueKind::Text: {
        const auto& s = as_text();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    case ValueKind::Enum: {
        const auto& s = as_enum();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    case ValueKind::Number: {
        double d = as_number();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert number to JSON: non-finite value");
        }
        // Целые числа пишем без дробной части: 5000, а не 5000.0
        if (std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) {
            out.SetInt64(static_cast<std::int64_t>(d));
        } else {
            out.SetDouble(d);
        }
        return;
    }

    case ValueKind::Boolean:
        out.SetBool(as_bool());
        return;

    case ValueKind::Date:
        out.SetDouble(to_epoch_seconds(as_date()));
        return;

    case ValueKind::Composite:
        out.SetObject();
        for (const auto& [key, val] : as_composite()) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
        return;
    }

    out.SetNull();
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

std::string Value::to_json() const {
    rapidjson::Document doc = to_rapidjson_document();
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string Value::to_display_string() const {
    switch (kind()) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Text:
        return as_text();
    case ValueKind::Enum:
        return as_enum();
    case ValueKind::Number:
        return format_number(as_number());
    case ValueKind::Boolean:
        return as_bool() ? "true" : "false";
    case ValueKind::Date:
        return format_timestamp(as_date());
    case ValueKind::Composite:
        return to_json();
    }
    return {};
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

double to_epoch_seconds(Timestamp t) {
    using seconds_f = std::chrono::duration<double>;
    return std::chrono::duration_cast<seconds_f>(t.time_since_epoch()).count();
}

std::optional<Timestamp> try_from_epoch_seconds(double seconds) {
    using seconds_f = std::chrono::duration<double>;
    using ticks_f = std::chrono::duration<double, Timestamp::period>;

    // Преобразование в тики в double, чтобы проверить диапазон до приведения к rep
    double ticks = std::chrono::duration_cast<ticks_f>(seconds_f(seconds)).count();
    constexpr auto kMaxTicks = static_cast<double>(std::numeric_limits<Timestamp::rep>::max());
    if (!std::isfinite(ticks) || !(std::fabs(ticks) < kMaxTicks)) {
        return std::nullopt;
    }
    return Timestamp(Timestamp::duration(static_cast<Timestamp::rep>(ticks)));
}

Timestamp from_epoch_seconds(double seconds) {
    auto t = try_from_epoch_seconds(seconds);
    if (!t) {
        throw std::out_of_range("epoch seconds out of range: " + format_number(seconds));
    }
    return *t;
}

bool is_finite_value(const Value& value) {
    if (const auto* d = value.get_number()) {
        return std::isfinite(*d);
    }
    if (const auto* obj = value.get_composite()) {
        for (const auto& [key, nested] : *obj) {
            if (!is_finite_value(nested)) {
                return false;
            }
        }
    }
    return true;
}

std::string format_timestamp(Timestamp t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(t));
    std::tm tm = platform::utc_time(tt);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::string format_number(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", v);
    return buf;
}

}  // namespace duet
