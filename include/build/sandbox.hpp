#pragma once

#include <filesystem>
#include <string>

namespace solbuild {

/**
 * @brief 表示一次构建独占的沙箱目录
 * 沙箱在构建开始时被清空重建，构建结束后保留，交给评测脚本使用。
 * 同一个沙箱路径不支持同时进行两次构建。
 *
 * SANDBOX
 * ├── aplusb.cpp // 复制进来的选手程序，文件名为 <problem>.<language tag>
 * ├── aplusb.exe // 编译产物（Java 为 aplusb.jar，Python 为源文件本身）
 * ├── compile.outputs // 本次构建中编译器的全部输出
 * ├── exec.sh // 由模板生成的执行脚本
 * ├── run.sh // 由模板生成的运行脚本
 * └── (manager.exe) // 交互题的 manager
 */
struct sandbox {
    explicit sandbox(const std::filesystem::path &dir);

    const std::filesystem::path &path() const;

    /**
     * @brief 递归删除并重新创建沙箱目录
     * @throw io_error 若文件系统操作失败
     */
    void recreate() const;

    /**
     * @brief 将选手程序复制进沙箱
     * @param solution 选手程序路径
     * @param canonical_name 沙箱内的文件名，比如 aplusb.cpp
     * @return 沙箱内的文件路径
     * @throw io_error 若复制失败
     */
    std::filesystem::path place_solution(const std::filesystem::path &solution, const std::string &canonical_name) const;

    /**
     * @brief 将 grader 等文件以原文件名复制进沙箱，覆盖同名文件
     * @throw io_error 若复制失败
     */
    void copy_in(const std::filesystem::path &file) const;

    /**
     * @brief 删除沙箱内的文件
     * @throw io_error 若删除失败
     */
    void remove(const std::string &name) const;

    /**
     * @brief 编译输出的记录文件，每次构建重新创建
     */
    std::filesystem::path compile_outputs() const;

    /**
     * @brief 在沙箱目录下执行 fn
     * 执行前切换进程的工作目录，无论 fn 正常返回还是抛出异常，
     * 都会恢复原来的工作目录。
     */
    template <typename Fn>
    auto scoped(Fn &&fn) const {
        working_directory_guard guard(dir);
        return fn();
    }

private:
    std::filesystem::path dir;

    struct working_directory_guard {
        explicit working_directory_guard(const std::filesystem::path &dir);
        ~working_directory_guard();

        working_directory_guard(const working_directory_guard &) = delete;
        working_directory_guard &operator=(const working_directory_guard &) = delete;

    private:
        std::filesystem::path previous;
    };
};

}  // namespace solbuild
