#include "data_loader.hpp"
#include "threadsignal.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>
#include <string>
#include <future>
#include <algorithm>
#include <chrono>

using std::vector;
using std::string;
using std::cout;
using std::endl;

using std::ifstream;
using std::stringstream;
using std::future;

DataLoader::DataLoader(const std::string& filename, char delimiter, int thread_count, bool verbose)
    : max_record_size_(0), max_item_(0) {

    auto begintime = std::chrono::high_resolution_clock::now();
    if (verbose) {
        cout << "正在加载事务文件到内存: " << filename << "..." << endl;
    }

    // 第一阶段：串行读取所有行到内存
    vector<string> rawLines = readAllLines(filename);

    if (verbose) {
        cout << "文件读取完成，共 " << rawLines.size() << " 行数据" << endl;
    }

    // 预分配内存，每行对应一条事务
    records_.resize(rawLines.size());

    // 第二阶段：并发解析数据
    parseLinesConcurrently(rawLines, delimiter, thread_count);

    if (verbose) {
        auto endtime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endtime - begintime);
        cout << "数据解析完成！共解析 " << records_.size()
             << " 条事务，最大事务长度: " << max_record_size_
             << "，最大项: " << max_item_
             << "，耗时: " << duration.count() << "ms" << endl;
    }
}

vector<string> DataLoader::readAllLines(const std::string& filename) {
    ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("无法打开文件: " + filename);
    }

    vector<string> rawLines;
    string line;
    while (std::getline(file, line)) {
        rawLines.push_back(line);
    }

    // 去掉文件末尾的空行
    while (!rawLines.empty() && rawLines.back().find_first_not_of(" \t\r\n") == string::npos) {
        rawLines.pop_back();
    }

    return rawLines;
}

void DataLoader::parseLinesConcurrently(const vector<string>& rawLines, char delimiter, int thread_count) {
    size_t totalLines = rawLines.size();
    if (totalLines == 0) {
        return;
    }

    size_t numThreads = resolveThreadCount(thread_count > 0 ? static_cast<size_t>(thread_count) : 0);
    if (numThreads > totalLines) numThreads = totalLines;

    // 计算每个线程处理的行数
    size_t linesPerThread = totalLines / numThreads;

    // 获取线程池实例
    auto& tpool = getThreadPool(thread_count > 0 ? static_cast<size_t>(thread_count) : 0);

    // 存储线程局部统计信息
    vector<size_t> threadMaxRecordSizes(numThreads, 0);
    vector<Item> threadMaxItems(numThreads, 0);
    vector<future<void>> futures;

    // 将数据分割并提交任务到线程池
    for (size_t t = 0; t < numThreads; t++) {
        size_t startIdx = t * linesPerThread;
        size_t endIdx = (t == numThreads - 1) ? totalLines : (t + 1) * linesPerThread;

        futures.push_back(tpool.submit_task([this, &rawLines, startIdx, endIdx, t,
                            &threadMaxRecordSizes, &threadMaxItems, delimiter]() {
            parseLinesRange(rawLines, startIdx, endIdx, delimiter,
                          threadMaxRecordSizes[t], threadMaxItems[t]);
        }));
    }

    // 等待所有任务完成，再取出任务中抛出的异常
    for (auto& task : futures) {
        task.wait();
    }
    for (auto& task : futures) {
        task.get();
    }

    // 合并统计信息
    max_record_size_ = *std::max_element(threadMaxRecordSizes.begin(), threadMaxRecordSizes.end());
    max_item_ = *std::max_element(threadMaxItems.begin(), threadMaxItems.end());
}

void DataLoader::parseLinesRange(const vector<string>& rawLines,
                                size_t startIdx, size_t endIdx, char delimiter,
                                size_t& localMaxRecordSize, Item& localMaxItem) {
    for (size_t lineIdx = startIdx; lineIdx < endIdx; lineIdx++) {
        Transaction record = parseLine(rawLines[lineIdx], delimiter, lineIdx + 1);

        for (Item item : record) {
            if (item > localMaxItem) {
                localMaxItem = item;
            }
        }
        if (record.size() > localMaxRecordSize) {
            localMaxRecordSize = record.size();
        }

        records_[lineIdx] = std::move(record);
    }
}

Transaction DataLoader::parseLine(const string& line, char delimiter, size_t line_number) {
    Transaction record;
    std::unordered_set<Item> seen;
    stringstream ss(line);
    string field;

    while (std::getline(ss, field, delimiter)) {
        // 去除前后空白
        size_t start = field.find_first_not_of(" \t\n\r");
        if (start == string::npos) {
            continue;
        }
        size_t end = field.find_last_not_of(" \t\n\r");
        field = field.substr(start, end - start + 1);

        Item item = 0;
        size_t parsed = 0;
        try {
            item = std::stoi(field, &parsed);
        } catch (const std::invalid_argument&) {
            parsed = 0;
        } catch (const std::out_of_range&) {
            throw std::runtime_error("第 " + std::to_string(line_number) + " 行的项超出范围: " + field);
        }
        if (parsed != field.size()) {
            throw std::runtime_error("第 " + std::to_string(line_number) + " 行包含非整数项: " + field);
        }

        // 同一事务中的重复项只保留一次
        if (seen.insert(item).second) {
            record.push_back(item);
        }
    }

    return record;
}
