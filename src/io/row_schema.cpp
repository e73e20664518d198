/**
 * @file row_schema.cpp
 * @brief Таблица колонок файла Lsetwatch
 */

#include "row_schema.hpp"
#include "lsetwatch_errors.hpp"

namespace lsetwatch::io {

namespace {

using Marker = Defaulted<int, 0>;
using ItemCount = Defaulted<int, 1>;
using TemplateValue = Defaulted<SetTemplate, SetTemplate::FreeConfiguration>;
using InventoryValue = Defaulted<InventoryStatus, InventoryStatus::Unspecified>;
using AccessoryValue = Defaulted<AccessoryStatus, AccessoryStatus::NotPresent>;

// === Привязка колонок к полям записи ===

template <auto Member, auto Decode>
void decodeMember(std::string_view raw, const ValueFormat& format, LsetwatchRow& row) {
    row.*Member = Decode(raw, format);
}

template <auto Member, auto Encode>
std::string encodeMember(const LsetwatchRow& row, const ValueFormat& format) {
    return Encode(row.*Member, format);
}

template <auto Trade, auto Member, auto Decode>
void decodeTradeMember(std::string_view raw, const ValueFormat& format, LsetwatchRow& row) {
    (row.*Trade).*Member = Decode(raw, format);
}

template <auto Trade, auto Member, auto Encode>
std::string encodeTradeMember(const LsetwatchRow& row, const ValueFormat& format) {
    return Encode((row.*Trade).*Member, format);
}

template <auto Member, auto Decode, auto Encode>
constexpr ColumnDescriptor column(std::string_view name, ColumnKind kind,
                                  std::string_view default_text = "", bool required = false) {
    return {name, kind, required, default_text,
            &decodeMember<Member, Decode>, &encodeMember<Member, Encode>};
}

template <auto Trade, auto Member, auto Decode, auto Encode>
constexpr ColumnDescriptor tradeColumn(std::string_view name, ColumnKind kind,
                                       std::string_view default_text = "") {
    return {name, kind, false, default_text,
            &decodeTradeMember<Trade, Member, Decode>, &encodeTradeMember<Trade, Member, Encode>};
}

constexpr auto kPurchase = &LsetwatchRow::purchase;
constexpr auto kSale = &LsetwatchRow::sale;

// Порядок строк таблицы совпадает с порядком колонок файла
const std::array<ColumnDescriptor, kColumnCount> kSchema = {{
    column<&LsetwatchRow::number, &decodeRequiredText, &encodeRequiredText>(
        "number", ColumnKind::RequiredText, "", true),
    column<&LsetwatchRow::version, &decodeRequiredText, &encodeRequiredText>(
        "version", ColumnKind::RequiredText, "", true),
    column<&LsetwatchRow::marker, &decodeDefaulted<Marker>, &encodeDefaulted<Marker>>(
        "marker", ColumnKind::Integer, "0"),
    column<&LsetwatchRow::color, &decodeEscapedText, &encodeEscapedText>(
        "color", ColumnKind::EscapedText),
    column<&LsetwatchRow::set_template, &decodeDefaulted<TemplateValue>, &encodeDefaulted<TemplateValue>>(
        "template", ColumnKind::Enumeration, "0"),
    column<&LsetwatchRow::own_category, &decodeEscapedText, &encodeEscapedText>(
        "mygroup", ColumnKind::EscapedText),
    column<&LsetwatchRow::state, &decodeOptionalEnum<SetState>, &encodeOptionalEnum<SetState>>(
        "state", ColumnKind::Enumeration),

    // Покупка
    tradeColumn<kPurchase, &TradeInfo::condition,
                &decodeOptionalEnum<ItemCondition>, &encodeOptionalEnum<ItemCondition>>(
        "purc_condition", ColumnKind::Enumeration),
    tradeColumn<kPurchase, &TradeInfo::platform, &decodeEscapedText, &encodeEscapedText>(
        "purc_platform", ColumnKind::EscapedText),
    tradeColumn<kPurchase, &TradeInfo::counterparty, &decodeEscapedText, &encodeEscapedText>(
        "purc_person", ColumnKind::EscapedText),
    tradeColumn<kPurchase, &TradeInfo::date, &decodeDate, &encodeDate>(
        "purc_date", ColumnKind::Date),
    tradeColumn<kPurchase, &TradeInfo::reference, &decodeEscapedText, &encodeEscapedText>(
        "purc_number", ColumnKind::EscapedText),
    tradeColumn<kPurchase, &TradeInfo::price, &decodeDecimal, &encodeDecimal>(
        "purc_price", ColumnKind::Decimal),
    tradeColumn<kPurchase, &TradeInfo::shipping, &decodeDecimal, &encodeDecimal>(
        "purc_shipc", ColumnKind::Decimal),
    tradeColumn<kPurchase, &TradeInfo::costs, &decodeDecimal, &encodeDecimal>(
        "purc_costs", ColumnKind::Decimal),
    tradeColumn<kPurchase, &TradeInfo::items, &decodeDefaulted<ItemCount>, &encodeDefaulted<ItemCount>>(
        "purc_items", ColumnKind::Integer, "1"),

    // Продажа
    tradeColumn<kSale, &TradeInfo::condition,
                &decodeOptionalEnum<ItemCondition>, &encodeOptionalEnum<ItemCondition>>(
        "sell_condition", ColumnKind::Enumeration),
    tradeColumn<kSale, &TradeInfo::platform, &decodeEscapedText, &encodeEscapedText>(
        "sell_platform", ColumnKind::EscapedText),
    tradeColumn<kSale, &TradeInfo::counterparty, &decodeEscapedText, &encodeEscapedText>(
        "sell_person", ColumnKind::EscapedText),
    tradeColumn<kSale, &TradeInfo::date, &decodeDate, &encodeDate>(
        "sell_date", ColumnKind::Date),
    tradeColumn<kSale, &TradeInfo::reference, &decodeEscapedText, &encodeEscapedText>(
        "sell_number", ColumnKind::EscapedText),
    tradeColumn<kSale, &TradeInfo::price, &decodeDecimal, &encodeDecimal>(
        "sell_price", ColumnKind::Decimal),
    tradeColumn<kSale, &TradeInfo::shipping, &decodeDecimal, &encodeDecimal>(
        "sell_shipc", ColumnKind::Decimal),
    tradeColumn<kSale, &TradeInfo::costs, &decodeDecimal, &encodeDecimal>(
        "sell_costs", ColumnKind::Decimal),
    tradeColumn<kSale, &TradeInfo::items, &decodeDefaulted<ItemCount>, &encodeDefaulted<ItemCount>>(
        "sell_items", ColumnKind::Integer, "1"),

    column<&LsetwatchRow::vip_points_earned, &decodeDecimal, &encodeDecimal>(
        "vip_points_get", ColumnKind::Decimal),
    column<&LsetwatchRow::vip_points_redeemed, &decodeDecimal, &encodeDecimal>(
        "vip_points_sub", ColumnKind::Decimal),
    column<&LsetwatchRow::cashback, &decodeDecimal, &encodeDecimal>(
        "cashback", ColumnKind::Decimal),
    column<&LsetwatchRow::cashback_type, &decodeOptionalEnum<CashbackType>, &encodeOptionalEnum<CashbackType>>(
        "cashback_type", ColumnKind::Enumeration),
    column<&LsetwatchRow::location, &decodeEscapedText, &encodeEscapedText>(
        "location", ColumnKind::EscapedText),
    column<&LsetwatchRow::addition, &decodeEscapedText, &encodeEscapedText>(
        "addition", ColumnKind::EscapedText),
    column<&LsetwatchRow::completeness, &decodeDefaulted<InventoryValue>, &encodeDefaulted<InventoryValue>>(
        "completeness", ColumnKind::Enumeration, "0"),
    column<&LsetwatchRow::piece_count_override, &decodeOptionalInt, &encodeOptionalInt>(
        "altern_pieces", ColumnKind::Integer),
    column<&LsetwatchRow::packaging, &decodeDefaulted<AccessoryValue>, &encodeDefaulted<AccessoryValue>>(
        "packaging", ColumnKind::Enumeration, "0"),
    column<&LsetwatchRow::instructions, &decodeDefaulted<AccessoryValue>, &encodeDefaulted<AccessoryValue>>(
        "instructions", ColumnKind::Enumeration, "0"),
    column<&LsetwatchRow::sales_value, &decodeDecimal, &encodeDecimal>(
        "sales_value", ColumnKind::Decimal),
    column<&LsetwatchRow::to_sell, &decodeFlag, &encodeFlag>(
        "to_sell", ColumnKind::Flag),
    column<&LsetwatchRow::notes, &decodeEscapedText, &encodeEscapedText>(
        "notes", ColumnKind::EscapedText),
    column<&LsetwatchRow::tags, &decodeStringList, &encodeStringList>(
        "mytags", ColumnKind::List),
    column<&LsetwatchRow::documents, &decodeStringList, &encodeStringList>(
        "documents", ColumnKind::List),
    column<&LsetwatchRow::reminder_date, &decodeDate, &encodeDate>(
        "reminder_date", ColumnKind::Date),
    column<&LsetwatchRow::last_edit, &decodeTimestamp, &encodeTimestamp>(
        "last_edit", ColumnKind::Timestamp, "", true),
}};

} // anonymous namespace

const std::array<ColumnDescriptor, kColumnCount>& rowSchema() noexcept {
    return kSchema;
}

std::optional<size_t> findColumn(std::string_view name) noexcept {
    for (size_t i = 0; i < kSchema.size(); ++i) {
        if (kSchema[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> headerNames() {
    std::vector<std::string> names;
    names.reserve(kSchema.size());
    for (const auto& column : kSchema) {
        names.emplace_back(column.name);
    }
    return names;
}

LsetwatchRow decodeRow(const RawRecord& raw, const ValueFormat& format, size_t line) {
    LsetwatchRow row;

    for (size_t i = 0; i < kSchema.size(); ++i) {
        const auto& column = kSchema[i];
        try {
            column.decode(raw[i], format, row);
        } catch (const ValueError& e) {
            throw CoercionError(e.what(), line, std::string(column.name), raw[i]);
        }
    }

    return row;
}

RawRecord encodeRow(const LsetwatchRow& row, const ValueFormat& format, size_t line) {
    RawRecord raw;

    for (size_t i = 0; i < kSchema.size(); ++i) {
        const auto& column = kSchema[i];
        try {
            raw[i] = column.encode(row, format);
        } catch (const ValueError& e) {
            throw CoercionError(e.what(), line, std::string(column.name), "");
        }
    }

    return raw;
}

} // namespace lsetwatch::io
