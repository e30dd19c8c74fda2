// ==============================================================================
// document.cpp - Документ: правки, атомарные патчи, сохранение
// ==============================================================================

#include "duet/document.hpp"

#include <utility>

namespace duet {

// ----------------------------------------------------------------------------
// DocumentError
// ----------------------------------------------------------------------------

DocumentError::DocumentError(ValidationError error)
    : std::runtime_error("edit failed: " + error.format()), error_(std::move(error)) {}

std::string pointer_for_field(std::string_view field_id) {
    std::string path = "/";
    for (char c : field_id) {
        if (c == '~') {
            path += "~0";
        } else if (c == '/') {
            path += "~1";
        } else {
            path += c;
        }
    }
    return path;
}

// ----------------------------------------------------------------------------
// Конструирование
// ----------------------------------------------------------------------------

Document::Document(std::shared_ptr<const Schema> schema, std::string storage_key,
                   std::shared_ptr<Storage> storage)
    : schema_(std::move(schema)),
      storage_key_(std::move(storage_key)),
      storage_(std::move(storage)) {
    if (!schema_) {
        throw std::invalid_argument("document requires a schema");
    }

    // Снимок либо значения по умолчанию, без слияния
    if (storage_) {
        if (auto text = storage_->load(storage_key_)) {
            auto decoded = decode_data(*schema_, *text);
            if (decoded) {
                data_ = std::make_shared<const DataMap>(std::move(decoded.data));
                retained_ = std::move(decoded.retained);
                return;
            }
        }
    }
    data_ = std::make_shared<const DataMap>(schema_->default_values());
}

// ----------------------------------------------------------------------------
// Чтение
// ----------------------------------------------------------------------------

std::shared_ptr<const DataMap> Document::snapshot() const {
    return std::atomic_load(&data_);
}

std::optional<Value> Document::get(std::string_view field_id) const {
    auto data = snapshot();
    auto it = data->find(std::string(field_id));
    if (it == data->end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Document::get_string(std::string_view field_id) const {
    auto value = get(field_id);
    if (value) {
        if (const auto* s = value->get_string_like()) {
            return *s;
        }
    }
    return "";
}

double Document::get_number(std::string_view field_id) const {
    auto value = get(field_id);
    if (value) {
        if (const auto* d = value->get_number()) {
            return *d;
        }
    }
    return 0.0;
}

bool Document::get_bool(std::string_view field_id) const {
    auto value = get(field_id);
    if (value) {
        if (const auto* b = value->get_bool()) {
            return *b;
        }
    }
    return false;
}

std::vector<std::string> Document::missing_required() const {
    auto data = snapshot();
    std::vector<std::string> missing;
    for (const auto& field : schema_->fields()) {
        if (!field.required) {
            continue;
        }
        auto it = data->find(field.id);
        if (it == data->end() || it->second.is_null()) {
            missing.push_back(field.id);
        }
    }
    return missing;
}

// ----------------------------------------------------------------------------
// Одиночные правки
// ----------------------------------------------------------------------------

void Document::edit(const std::string& field_id, Value value) {
    Patch ops{PatchOperation::replace(pointer_for_field(field_id), std::move(value))};
    auto result = apply_patch(std::move(ops), Source::User);
    if (!result) {
        throw DocumentError(*last_error_);
    }
}

bool Document::try_edit(const std::string& field_id, Value value) {
    Patch ops{PatchOperation::replace(pointer_for_field(field_id), std::move(value))};
    return apply_patch(std::move(ops), Source::User).success;
}

void Document::apply_edits(const std::vector<Edit>& edits) {
    Patch ops;
    ops.reserve(edits.size());
    for (const auto& e : edits) {
        ops.push_back(PatchOperation::replace(pointer_for_field(e.field), e.value));
    }
    apply_patch_or_throw(std::move(ops), Source::User);
}

// ----------------------------------------------------------------------------
// Патчи
// ----------------------------------------------------------------------------

PatchResult Document::apply_patch(Patch operations, Source source) {
    // Фаза 1: проверка всех операций, без мутаций
    std::vector<std::vector<std::string>> segments;
    std::vector<Value> coerced;
    segments.reserve(operations.size());
    coerced.reserve(operations.size());

    for (const auto& op : operations) {
        auto checked = validate_operation(*schema_, op);
        if (!checked) {
            return reject(std::move(operations), source, std::move(checked.error));
        }
        segments.push_back(split_pointer(op.path));
        coerced.push_back(std::move(checked.value));
    }

    // Фаза 2: применение к рабочей копии
    DataMap working = *snapshot();
    std::set<std::string> touched;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        apply_operation(working, segments[i], std::move(coerced[i]));
        touched.insert(segments[i].front());
    }

    commit(std::move(working), std::move(touched));

    auto result = PatchResult::succeeded(operations.size());
    audit_.append(std::move(operations), source, result);
    notify();
    return result;
}

std::size_t Document::apply_patch_or_throw(Patch operations, Source source) {
    auto result = apply_patch(std::move(operations), source);
    if (!result) {
        throw DocumentError(*last_error_);
    }
    return result.operations_applied;
}

PatchResult Document::apply_from_text(std::string_view text, Source source) {
    auto parsed = parse_patch_text(text, schema_.get());
    if (!parsed) {
        ValidationError error;
        error.kind = ErrorKind::MalformedInput;
        error.message = parsed.error;
        return reject(Patch{}, source, std::move(error));
    }
    return apply_patch(std::move(parsed.operations), source);
}

void Document::reset() {
    if (storage_) {
        storage_->remove(storage_key_);
    }
    retained_.clear();

    std::atomic_store(&data_, std::make_shared<const DataMap>(schema_->default_values()));
    last_error_.reset();
    recently_updated_.clear();
    ++update_counter_;

    audit_.append(Patch{}, Source::System, PatchResult::succeeded(0));
    notify();
}

PatchResult Document::reject(Patch operations, Source source, ValidationError error) {
    auto result = PatchResult::failed(error);
    last_error_ = std::move(error);
    audit_.append(std::move(operations), source, result);
    return result;
}

void Document::commit(DataMap working, std::set<std::string> touched) {
    std::atomic_store(&data_, std::make_shared<const DataMap>(std::move(working)));
    last_error_.reset();
    recently_updated_ = std::move(touched);
    ++update_counter_;
    persist();
}

void Document::persist() {
    if (!storage_) {
        return;
    }
    // Сохранение best-effort: ошибка не откатывает коммит
    try {
        last_save_ok_ = storage_->save(storage_key_, encode_data(*snapshot(), retained_));
    } catch (const std::runtime_error&) {
        last_save_ok_ = false;
    }
}

void Document::notify() {
    // Копия: подписчик может отписаться из обработчика
    auto observers = observers_;
    std::uint64_t counter = update_counter_.load();
    for (const auto& [id, observer] : observers) {
        observer(counter);
    }
}

// ----------------------------------------------------------------------------
// Недавно изменённые поля
// ----------------------------------------------------------------------------

bool Document::was_recently_updated(const std::string& field_id) const {
    return recently_updated_.count(field_id) > 0;
}

void Document::clear_recently_updated(const std::string& field_id) {
    recently_updated_.erase(field_id);
}

void Document::clear_all_recently_updated() {
    recently_updated_.clear();
}

// ----------------------------------------------------------------------------
// Экспорт и подписки
// ----------------------------------------------------------------------------

std::string Document::export_json() const {
    return encode_data(*snapshot(), {}, true);
}

std::size_t Document::subscribe(Observer observer) {
    std::size_t id = next_observer_id_++;
    observers_[id] = std::move(observer);
    return id;
}

void Document::unsubscribe(std::size_t id) {
    observers_.erase(id);
}

}  // namespace duet
