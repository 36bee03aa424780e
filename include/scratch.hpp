/**
 * @file scratch.hpp
 * @brief Scratch files and directories owned by one restore.
 */

#ifndef SCRATCH_HPP
#define SCRATCH_HPP

#include <string>
#include <vector>

/**
 * @brief Removes a file or directory tree, tolerating paths that are already gone.
 * @return True if nothing remains at the path afterwards.
 */
bool removeScratchPath(const std::string& path);

/**
 * @brief Directory removed with its content when the object goes out of scope.
 */
class ScratchDirectory {
public:
    /**
     * @brief Creates base/name, including missing parents.
     * @throws std::runtime_error If the directory cannot be created.
     */
    ScratchDirectory(const std::string& base, const std::string& name);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Registry of scratch file names for one execution.
 *
 * Names have the form "<dir>/restore-<executionId>-<basename><suffix>" so concurrent restores
 * never collide. Every name handed out is deleted by cleanup() or the destructor.
 */
class ScratchFiles {
public:
    ScratchFiles(std::string dir, std::string executionId, std::string basename);
    ~ScratchFiles();

    ScratchFiles(const ScratchFiles&) = delete;
    ScratchFiles& operator=(const ScratchFiles&) = delete;

    /**
     * @brief Returns (and tracks) the scratch path with the given suffix.
     */
    std::string path(const std::string& suffix = "");

    /**
     * @brief Deletes every tracked path.
     * @return Paths that could not be removed.
     */
    std::vector<std::string> cleanup();

    const std::vector<std::string>& tracked() const { return paths_; }

private:
    std::string prefix_;
    std::vector<std::string> paths_;
};

#endif // SCRATCH_HPP
