#pragma once
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

#include "LogMacros.h"

/**
 * @brief ConfigLoader：YAML 配置读取
 *
 * 读取失败（文件不存在 / 语法错误）在构造时抛 std::runtime_error；
 * 单个键缺失或类型不符时返回调用方给出的默认值，类型不符额外记一条 WARN。
 */
class ConfigLoader {
public:
    explicit ConfigLoader(const std::string& filePath) : path_(filePath) {
        try {
            config_ = std::make_shared<YAML::Node>(YAML::LoadFile(filePath));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to load config file " + filePath + ": " + e.what());
        }
    }

    // 顶层标量
    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        return getPath(key, defaultValue);
    }

    // 分层路径读取，例如 "fulfillment.lockTtlSeconds"
    template <typename T>
    T getPath(const std::string& path, const T& defaultValue) const {
        YAML::Node node = lookup(path);
        if (!node.IsDefined() || node.IsNull())
            return defaultValue;
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            LOG_WARN("Config key '{}' in {} has an unexpected type, using default ({})", path, path_, e.what());
            return defaultValue;
        }
    }

    bool has(const std::string& path) const {
        YAML::Node node = lookup(path);
        return node.IsDefined() && !node.IsNull();
    }

    const std::string& path() const noexcept { return path_; }

private:
    // 只读遍历：用 reset 重新绑定而不是赋值，避免改写原树
    YAML::Node lookup(const std::string& path) const {
        YAML::Node node;
        node.reset(*config_);
        std::stringstream ss(path);
        std::string segment;
        while (std::getline(ss, segment, '.')) {
            if (!node.IsMap())
                return YAML::Node(YAML::NodeType::Undefined);
            const YAML::Node& parent = node;
            YAML::Node child = parent[segment];
            if (!child.IsDefined())
                return YAML::Node(YAML::NodeType::Undefined);
            node.reset(child);
        }
        return node;
    }

    std::string path_;
    std::shared_ptr<YAML::Node> config_;
};
