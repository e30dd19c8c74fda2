// ==============================================================================
// duet/bridge.hpp - Мост между документом и агентом
// ==============================================================================
//
// Назначение:
// - ContextProvider: абстрактный источник контекста для агента
// - DocumentBridge: контекст из схемы и текущих значений документа,
//   применение ответа агента как патча
//
// ==============================================================================

#ifndef DUET_BRIDGE_HPP
#define DUET_BRIDGE_HPP

#include <duet/audit.hpp>
#include <duet/document.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace duet {

/// Источник контекста для агента
class ContextProvider {
public:
    virtual ~ContextProvider() = default;

    /// Текст, описывающий агенту схему и текущее состояние
    virtual std::string get_context() const = 0;

    /// Применить действия из ответа агента
    /// @return количество применённых операций (0 при ошибке)
    virtual std::size_t apply_actions(std::string_view response) = 0;
};

/// Контекст и действия для одного Document. Документ должен пережить мост.
class DocumentBridge : public ContextProvider {
public:
    explicit DocumentBridge(Document& document, Source source = Source::Llm)
        : document_(document), source_(source) {}

    /// describe() схемы, текущие значения, недостающие обязательные поля
    /// и инструкция по формату патча
    std::string get_context() const override;

    std::size_t apply_actions(std::string_view response) override;

    /// Результат последнего apply_actions
    const PatchResult& last_result() const { return last_result_; }

private:
    Document& document_;
    Source source_;
    PatchResult last_result_;
};

}  // namespace duet

#endif  // DUET_BRIDGE_HPP
