#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "infra/store/FulfillmentRecords.h"

// ------------------- 时间 -------------------
// 时间点统一以 Unix 毫秒整数序列化

std::int64_t ToEpochMillis(TimePoint tp);
TimePoint FromEpochMillis(std::int64_t ms);

// ------------------- 文档文本 -------------------
// 存储与缓存写入的序列化入口：非法 UTF-8 字节替换为 U+FFFD，不抛 type_error

std::string DumpDocument(const nlohmann::json& j);

// ------------------- 记录 <-> JSON -------------------
// 供 nlohmann::json 通过 ADL 调用：json j = order; auto o = j.get<OrderRecord>();
// 反序列化对缺失字段取默认值，兼容旧版本缓存内容

void to_json(nlohmann::json& j, const ProductRecord& v);
void from_json(const nlohmann::json& j, ProductRecord& v);

void to_json(nlohmann::json& j, const OrderLineItem& v);
void from_json(const nlohmann::json& j, OrderLineItem& v);

void to_json(nlohmann::json& j, const Pricing& v);
void from_json(const nlohmann::json& j, Pricing& v);

void to_json(nlohmann::json& j, const OrderRecord& v);
void from_json(const nlohmann::json& j, OrderRecord& v);

void to_json(nlohmann::json& j, const DeliveryLineItem& v);
void from_json(const nlohmann::json& j, DeliveryLineItem& v);

void to_json(nlohmann::json& j, const DeliveryRecord& v);
void from_json(const nlohmann::json& j, DeliveryRecord& v);

void to_json(nlohmann::json& j, const InvoiceRecord& v);
void from_json(const nlohmann::json& j, InvoiceRecord& v);

void to_json(nlohmann::json& j, const PaymentAllocation& v);
void from_json(const nlohmann::json& j, PaymentAllocation& v);

void to_json(nlohmann::json& j, const PaymentRecord& v);
void from_json(const nlohmann::json& j, PaymentRecord& v);

void to_json(nlohmann::json& j, const ClientRecord& v);
void from_json(const nlohmann::json& j, ClientRecord& v);

void to_json(nlohmann::json& j, const EmployeeStatsRecord& v);

void to_json(nlohmann::json& j, const ReturnLineItem& v);
void from_json(const nlohmann::json& j, ReturnLineItem& v);

void to_json(nlohmann::json& j, const ReturnRecord& v);
void from_json(const nlohmann::json& j, ReturnRecord& v);
