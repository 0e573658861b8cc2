#ifndef __WB_PROCESS_TREE__
#define __WB_PROCESS_TREE__

#include "Headers.hpp"

namespace wb {
/**
 * @brief Read-only view of the OS process tree.
 */
class ProcessTree {
 public:
  virtual ~ProcessTree() {}

  /**
   * @brief Lists the direct children of `pid`.
   * @throws std::runtime_error if the OS could not be queried.
   */
  virtual vector<pid_t> childrenOf(pid_t pid) = 0;

  /** @brief The implementation for the platform we were built for. */
  static shared_ptr<ProcessTree> createNative();
};

#if __APPLE__
/** @brief Uses libproc's proc_listchildpids. */
class LibprocProcessTree : public ProcessTree {
 public:
  virtual vector<pid_t> childrenOf(pid_t pid);
};
#else
/**
 * @brief Reads /proc/<pid>/task/<tid>/children, falling back to a scan of
 * every /proc/<pid>/stat when the kernel does not expose children files.
 */
class ProcfsProcessTree : public ProcessTree {
 public:
  explicit ProcfsProcessTree(const string &_procRoot = "/proc")
      : procRoot(_procRoot) {}

  virtual vector<pid_t> childrenOf(pid_t pid);

  /**
   * @brief Parent pid from the contents of a /proc/<pid>/stat file, or -1 if
   * it cannot be parsed. The command name may itself contain ") ".
   */
  static pid_t parseParentPid(const string &statContents);

 protected:
  string procRoot;

  optional<vector<pid_t>> childrenFromTaskFiles(pid_t pid);
  vector<pid_t> childrenFromStatScan(pid_t pid);
};
#endif
}  // namespace wb

#endif  // __WB_PROCESS_TREE__
