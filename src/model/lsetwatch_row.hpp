/**
 * @file lsetwatch_row.hpp
 * @brief Запись коллекции Lsetwatch (одна строка файла экспорта)
 */

#pragma once

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lsetwatch::model {

/// Список строк (теги, пути к документам)
using StringList = std::vector<std::string>;

/// Календарная дата без времени
using Date = std::chrono::year_month_day;

/// Абсолютный момент времени с точностью до секунды (UTC)
using Timestamp = std::chrono::sys_seconds;

/**
 * @brief Значение со значением по умолчанию
 *
 * Пустая колонка читается как значение по умолчанию, но запоминает,
 * что в файле колонка была пустой: при записи она снова становится пустой.
 * Сравнение выполняется по фактическому значению.
 */
template <typename T, T Default>
class Defaulted {
public:
    using value_type = T;

    constexpr Defaulted() noexcept : value_(Default) {}
    constexpr Defaulted(T value) noexcept : value_(value) {}

    /**
     * @brief Значение, прочитанное из пустой колонки
     */
    [[nodiscard]] static constexpr Defaulted absent() noexcept {
        Defaulted result;
        result.value_.reset();
        return result;
    }

    [[nodiscard]] static constexpr T defaultValue() noexcept { return Default; }

    /// Фактическое значение (по умолчанию, если колонка была пустой)
    [[nodiscard]] constexpr T value() const noexcept { return value_.value_or(Default); }

    /// Значение задано явно (не из пустой колонки)
    [[nodiscard]] constexpr bool isExplicit() const noexcept { return value_.has_value(); }

    constexpr bool operator==(const Defaulted& other) const noexcept {
        return value() == other.value();
    }

    constexpr bool operator==(T other) const noexcept { return value() == other; }

private:
    std::optional<T> value_;
};

/**
 * @brief Сведения о покупке или продаже набора
 */
struct TradeInfo {
    std::optional<ItemCondition> condition;   ///< Состояние (purc_/sell_condition)
    std::optional<std::string> platform;      ///< Площадка
    std::optional<std::string> counterparty;  ///< Продавец / покупатель
    std::optional<Date> date;                 ///< Дата сделки
    std::optional<std::string> reference;     ///< Номер заказа / транзакции
    std::optional<double> price;              ///< Цена
    std::optional<double> shipping;           ///< Стоимость доставки
    std::optional<double> costs;              ///< Дополнительные расходы
    Defaulted<int, 1> items;                  ///< Число наборов для разделения расходов

    bool operator==(const TradeInfo&) const = default;
};

/**
 * @brief Одна запись файла экспорта Lsetwatch
 *
 * Порядок полей совпадает с порядком колонок файла.
 */
struct LsetwatchRow {
    std::string number;                       ///< Номер набора без версии (обязательно)
    std::string version;                      ///< Версия набора (обязательно)
    Defaulted<int, 0> marker;                 ///< Номер значка (0: без значка)
    std::optional<std::string> color;         ///< Цвет пометки (#cc0022)
    Defaulted<SetTemplate, SetTemplate::FreeConfiguration> set_template;  ///< Шаблон
    std::optional<std::string> own_category;  ///< Собственная категория (mygroup)
    std::optional<SetState> state;            ///< Состояние набора

    TradeInfo purchase;                       ///< Покупка (purc_*)
    TradeInfo sale;                           ///< Продажа (sell_*)

    std::optional<double> vip_points_earned;  ///< Получено VIP-баллов
    std::optional<double> vip_points_redeemed;///< Списано VIP-баллов
    std::optional<double> cashback;           ///< Сумма кэшбэка
    std::optional<CashbackType> cashback_type;///< Тип кэшбэка
    std::optional<std::string> location;      ///< Место хранения
    std::optional<std::string> addition;      ///< Дополнительная информация
    Defaulted<InventoryStatus, InventoryStatus::Unspecified> completeness;  ///< Инвентаризация
    std::optional<int> piece_count_override;  ///< Переопределение числа деталей
    Defaulted<AccessoryStatus, AccessoryStatus::NotPresent> packaging;      ///< Упаковка
    Defaulted<AccessoryStatus, AccessoryStatus::NotPresent> instructions;   ///< Инструкция
    std::optional<double> sales_value;        ///< Оценочная стоимость продажи
    std::optional<bool> to_sell;              ///< Продажа запланирована
    std::optional<std::string> notes;         ///< Заметки
    StringList tags;                          ///< Собственные теги (mytags)
    StringList documents;                     ///< Пути связанных документов
    std::optional<Date> reminder_date;        ///< Дата напоминания
    Timestamp last_edit{};                    ///< Время последнего изменения (UTC)

    bool operator==(const LsetwatchRow&) const = default;
};

/**
 * @brief Последовательность записей
 */
using RowList = std::vector<LsetwatchRow>;

} // namespace lsetwatch::model
