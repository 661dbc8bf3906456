#include "dataload/data_loader.hpp"
#include "fptree/growth.hpp"
#include "rules/rules.hpp"
#include <iostream>
#include <chrono>
#include <exception>
#include <string>

using std::cout;
using std::cerr;
using std::endl;

namespace {

void printUsage(const char* program) {
    cout << "用法: " << program << " <data_file> <min_support> [min_confidence] [threads]" << endl;
    cout << "  min_support     最小支持计数（>= 1）" << endl;
    cout << "  min_confidence  最小置信度，默认 0.7" << endl;
    cout << "  threads         并发数量，默认 1，0 表示硬件并发数" << endl;
}

void printItemset(const Itemset& itemset) {
    cout << "(";
    for (size_t i = 0; i < itemset.size(); i++) {
        if (i > 0) cout << ", ";
        cout << itemset[i];
    }
    cout << ")";
}

int run(int argc, char* argv[]) {
    std::string db_path = argv[1];
    Support min_support = std::stoll(argv[2]);
    double confidence = argc > 3 ? std::stod(argv[3]) : 0.7;
    int co = argc > 4 ? std::stoi(argv[4]) : 1;
    if (co < 0) {
        cerr << "并发数量不能为负数: " << co << endl;
        return 1;
    }

    cout << "========== 算法性能测试 ==========" << endl;

    // 数据加载计时
    auto data_load_start = std::chrono::high_resolution_clock::now();
    DataLoader loader(db_path, ' ', co, true);
    auto data_load_end = std::chrono::high_resolution_clock::now();
    auto data_load_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        data_load_end - data_load_start
    );

    // FP-Growth 计时
    MinerOptions options;
    options.min_support = min_support;
    options.thread_count = static_cast<size_t>(co);
    options.verbose = true;

    auto fptree_start = std::chrono::high_resolution_clock::now();
    PatternMap patterns = FPGrowth(options).mine(loader.transactions());
    auto fptree_end = std::chrono::high_resolution_clock::now();
    auto fptree_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        fptree_end - fptree_start
    );

    int lc = 1;
    for (const auto& level : groupByLevel(patterns)) {
        cout << "level: " << lc << " " << level.size() << endl;
        lc++;
    }

    // 关联规则计时
    auto rules_start = std::chrono::high_resolution_clock::now();
    RuleMap rules = generateAssociationRules(patterns, confidence);
    auto rules_end = std::chrono::high_resolution_clock::now();
    auto rules_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        rules_end - rules_start
    );

    size_t rule_count = 0;
    cout << "\n使用置信度: " << confidence << endl;
    for (const auto& [antecedent, consequents] : rules) {
        for (const auto& rule : consequents) {
            printItemset(antecedent);
            cout << " => ";
            printItemset(rule.consequent);
            cout << " 置信度: " << rule.confidence << " 支持计数: " << rule.support << endl;
            rule_count++;
        }
    }
    cout << "关联规则数量: " << rule_count << endl;

    // 输出结果
    cout << "\n========== 性能统计 ==========" << endl;
    cout << "事务数量: " << loader.size() << endl;
    cout << "频繁项集数量: " << patterns.size() << endl;
    cout << "数据加载时间: " << data_load_duration.count() << " ms" << endl;
    cout << "FP-Growth 算法时间: " << fptree_duration.count() << " ms" << endl;
    cout << "关联规则时间: " << rules_duration.count() << " ms" << endl;
    cout << "total time: "
         << data_load_duration.count() + fptree_duration.count() + rules_duration.count() << " ms" << endl;
    cout << "================================" << endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        cerr << "错误: " << e.what() << endl;
        return 1;
    }
}
