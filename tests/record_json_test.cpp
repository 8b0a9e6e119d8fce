#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "infra/codec/RecordJson.h"

class RecordJsonTest : public ::testing::Test {
protected:
    OrderRecord SampleOrder() const {
        OrderRecord order;
        order.orderId = "ord-1";
        order.orderNumber = "ORD26100001";
        order.clientId = "cli-1";
        order.version = 3;
        order.advance = 250.0;
        return order;
    }
};

TEST_F(RecordJsonTest, DumpDocumentReplacesInvalidUtf8) {
    // Given: 备注里混入非法 UTF-8 字节
    OrderRecord order = SampleOrder();
    order.notes = std::string("fragile \xC3\x28 handle");
    const nlohmann::json j = order;

    // When
    std::string body;
    ASSERT_NO_THROW(body = DumpDocument(j));

    // Then: 文本仍是合法 JSON，其余字段完整
    const auto parsed = nlohmann::json::parse(body, nullptr, false);
    ASSERT_FALSE(parsed.is_discarded());
    const auto restored = parsed.get<OrderRecord>();
    EXPECT_EQ(restored.orderNumber, "ORD26100001");
    EXPECT_EQ(restored.version, 3u);
    EXPECT_DOUBLE_EQ(restored.advance, 250.0);
    EXPECT_EQ(restored.notes.rfind("fragile ", 0), 0u);
    EXPECT_NE(restored.notes.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(RecordJsonTest, DumpDocumentKeepsValidTextUnchanged) {
    OrderRecord order = SampleOrder();
    order.notes = "deliver to gate 2, \xE4\xB8\x8A\xE5\x8D\x88";
    const nlohmann::json j = order;

    const auto restored = nlohmann::json::parse(DumpDocument(j)).get<OrderRecord>();

    EXPECT_EQ(restored.notes, order.notes);
    EXPECT_EQ(DumpDocument(j), j.dump());
}
