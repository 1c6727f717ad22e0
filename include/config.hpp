#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 每个提交的工作目录的父目录
 * 工作目录以 auto_generated_code_file_<uuid> 命名，评测结束后删除
 * 可以通过 --run-dir 或环境变量 RUNDIR 设置
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 测试数据的根目录
 * 测试数据存放在 DATA_DIR/<problem_id>/<run_type>/<n>/ 中
 * 可以通过 --data-dir 或环境变量 DATADIR 设置
 */
extern std::filesystem::path DATA_DIR;

/**
 * @brief 评测结果和评测任务记录的保存目录
 * 可以通过 --state-dir 或环境变量 STATEDIR 设置
 */
extern std::filesystem::path STATE_DIR;

/**
 * @brief 测试数据输入文件名
 */
extern const std::string INPUT_FILENAME;

/**
 * @brief 测试数据标准输出文件名
 */
extern const std::string OUTPUT_FILENAME;

/**
 * @brief 工作目录名前缀
 */
extern const std::string WORKDIR_PREFIX;

/**
 * @brief 普通测试点的时间限制（单位为秒）
 */
extern double TEST_CASE_TIME_LIMIT;

/**
 * @brief 设计题只运行一次，时间限制更宽松（单位为秒）
 */
extern double DESIGN_TIME_LIMIT;

/**
 * @brief 编译时间限制（单位为秒）
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 评测任务处于 PENDING 状态时，在多长时间内仍然认为评测正在进行（单位为秒）
 * 任务队列无法区分"排队中"和"已丢失"的任务，因此需要这个宽限期
 */
extern long PENDING_GRACE_SECONDS;

/**
 * @brief 选手程序输出以及读取测试数据的最大字节数，默认 64M，小于 0 表示不限制
 * 可以通过 --max-io-size 或环境变量 MAXIOSIZE 设置
 */
extern long MAX_IO_SIZE;

/**
 * @brief 内容因超过 MAX_IO_SIZE 被截断时追加在末尾的标记
 */
extern const std::string TRUNCATED_MARK;

/**
 * @brief 调试模式，不删除工作目录以便检查
 */
extern bool DEBUG;

}  // namespace grader
