#ifndef DATA_LOADER_HPP
#define DATA_LOADER_HPP

#include <cstddef>
#include <vector>
#include <string>
#include "fptree/itemset.hpp"

/**
 * 数据加载器类
 * 负责把事务文件加载到内存，每行一条事务，项为整数
 * 同一行中重复出现的项只保留第一次出现
 */
class DataLoader {
public:
    // 数据库类型：所有事务的集合
    using Database = std::vector<Transaction>;

    /**
     * 构造函数：加载指定文件的数据
     * @param filename 文件路径
     * @param delimiter 分隔符，默认为空格
     * @param thread_count 并发解析的线程数，默认为0（使用硬件并发数）
     * @param verbose 是否输出加载过程
     * @throws std::runtime_error 文件无法打开或包含非整数项
     */
    DataLoader(const std::string& filename, char delimiter = ' ', int thread_count = 0, bool verbose = false);

    /**
     * 获取事务总数（包括空行）
     */
    size_t size() const noexcept {
        return records_.size();
    }

    size_t getMaxRecordSize() const noexcept {
        return max_record_size_;
    }

    Item getMaxItem() const noexcept {
        return max_item_;
    }

    /**
     * 获取全部事务
     */
    const Database& transactions() const noexcept {
        return records_;
    }

    /**
     * 获取指定索引的事务
     * @param index 事务索引
     * @return 事务的常量引用，越界时返回空事务
     */
    const Transaction& getRecord(size_t index) const {
        if (index >= records_.size()) {
            static const Transaction empty;
            return empty;
        }
        return records_[index];
    }

    /**
     * 解析单行数据
     * @param line 单行字符串
     * @param delimiter 分隔符
     * @param line_number 行号（从1开始，用于错误信息）
     * @return 解析后的事务
     */
    static Transaction parseLine(const std::string& line, char delimiter, size_t line_number);

private:
    /**
     * 读取文件所有行到内存
     */
    std::vector<std::string> readAllLines(const std::string& filename);

    /**
     * 并发解析数据行
     */
    void parseLinesConcurrently(const std::vector<std::string>& rawLines, char delimiter, int thread_count);

    /**
     * 解析指定范围内的数据行
     * @param localMaxRecordSize 本地最大事务长度
     * @param localMaxItem 本地最大项
     */
    void parseLinesRange(const std::vector<std::string>& rawLines,
                        size_t startIdx, size_t endIdx, char delimiter,
                        size_t& localMaxRecordSize, Item& localMaxItem);

    Database records_;          // 存储所有事务
    size_t max_record_size_;    // 最大事务长度
    Item max_item_;             // 事务中的最大项
};

#endif // DATA_LOADER_HPP
