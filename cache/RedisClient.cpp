#include "RedisClient.h"

#include "LogMacros.h"

namespace {

bool IsOkStatus(const redisReply* reply) {
    return reply && reply->type == REDIS_REPLY_STATUS && std::string(reply->str, reply->len) == "OK";
}

}  // namespace

RedisClient::RedisClient(const std::string& host, int port, const std::string& password, const struct timeval& timeout) :
    host_(host), port_(port), password_(password), timeout_(timeout), context_(nullptr) {}

RedisClient::~RedisClient() noexcept {
    Close();
}

bool RedisClient::Connect() {
    Close();
    context_ = redisConnectWithTimeout(host_.c_str(), port_, timeout_);
    if (!context_ || context_->err) {
        if (context_) {
            LOG_ERROR("[RedisClient] Connect error: {}", context_->errstr);
            redisFree(context_);
        }
        context_ = nullptr;
        return false;
    }
    redisSetTimeout(context_, timeout_);

    if (!password_.empty()) {
        redisReply* reply = Command({"AUTH", password_});
        bool ok = IsOkStatus(reply);
        if (reply)
            freeReplyObject(reply);
        if (!ok) {
            LOG_ERROR("[RedisClient] Auth failed for {}:{}", host_, port_);
            Close();
            return false;
        }
    }

    LOG_INFO("[RedisClient] Connected to {}:{}", host_, port_);
    return true;
}

void RedisClient::Close() noexcept {
    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }
}

bool RedisClient::IsConnected() const noexcept {
    return context_ && !context_->err;
}

bool RedisClient::EnsureConnected() {
    if (!IsConnected())
        return Connect();
    return true;
}

// argv 形式发送，值中含空格 / 二进制也安全
redisReply* RedisClient::Command(const std::vector<std::string>& argv) {
    std::vector<const char*> args;
    std::vector<size_t> lens;
    args.reserve(argv.size());
    lens.reserve(argv.size());
    for (const auto& a : argv) {
        args.push_back(a.data());
        lens.push_back(a.size());
    }
    auto* reply = reinterpret_cast<redisReply*>(redisCommandArgv(context_, static_cast<int>(args.size()), args.data(), lens.data()));
    if (!reply && context_ && context_->err)
        LOG_WARN("[RedisClient] {} failed: {}", argv.empty() ? "" : argv.front(), context_->errstr);
    return reply;
}

bool RedisClient::Get(const std::string& key, std::string& value) {
    if (!EnsureConnected())
        return false;
    redisReply* reply = Command({"GET", key});
    if (!reply)
        return false;
    bool ok = (reply->type == REDIS_REPLY_STRING);
    if (ok)
        value.assign(reply->str, reply->len);
    freeReplyObject(reply);
    return ok;
}

bool RedisClient::Set(const std::string& key, const std::string& value) {
    if (!EnsureConnected())
        return false;
    redisReply* reply = Command({"SET", key, value});
    bool ok = IsOkStatus(reply);
    if (reply)
        freeReplyObject(reply);
    return ok;
}

bool RedisClient::SetEx(const std::string& key, const std::string& value, int ttlSeconds) {
    if (!EnsureConnected())
        return false;
    redisReply* reply = Command({"SET", key, value, "EX", std::to_string(ttlSeconds)});
    bool ok = IsOkStatus(reply);
    if (reply)
        freeReplyObject(reply);
    return ok;
}

bool RedisClient::SetIfAbsent(const std::string& key, const std::string& value, long long ttlMs) {
    if (!EnsureConnected())
        return false;
    redisReply* reply = Command({"SET", key, value, "NX", "PX", std::to_string(ttlMs)});
    // key 已存在时服务端返回 nil
    bool ok = IsOkStatus(reply);
    if (reply)
        freeReplyObject(reply);
    return ok;
}

bool RedisClient::Del(const std::string& key) {
    if (!EnsureConnected())
        return false;
    redisReply* reply = Command({"DEL", key});
    bool ok = reply && reply->type == REDIS_REPLY_INTEGER;
    if (reply)
        freeReplyObject(reply);
    return ok;
}

std::optional<long long> RedisClient::EvalInteger(const std::string& script, const std::string& key, const std::vector<std::string>& args) {
    if (!EnsureConnected())
        return std::nullopt;
    std::vector<std::string> argv{"EVAL", script, "1", key};
    argv.insert(argv.end(), args.begin(), args.end());
    redisReply* reply = Command(argv);
    if (!reply)
        return std::nullopt;
    std::optional<long long> result;
    if (reply->type == REDIS_REPLY_INTEGER)
        result = reply->integer;
    else if (reply->type == REDIS_REPLY_ERROR)
        LOG_WARN("[RedisClient] EVAL error: {}", std::string(reply->str, reply->len));
    freeReplyObject(reply);
    return result;
}
