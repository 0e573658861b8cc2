#include "ProcessTree.hpp"

namespace wb {
#if __APPLE__
shared_ptr<ProcessTree> ProcessTree::createNative() {
  return shared_ptr<ProcessTree>(new LibprocProcessTree());
}

vector<pid_t> LibprocProcessTree::childrenOf(pid_t pid) {
  // Size the buffer generously, children can appear between the two calls
  int count = proc_listchildpids(pid, NULL, 0);
  if (count < 0) {
    throw std::runtime_error(string("proc_listchildpids failed: ") +
                             strerror(GetErrno()));
  }
  vector<pid_t> pids(count + 16);
  int rc = proc_listchildpids(pid, &pids[0], int(pids.size() * sizeof(pid_t)));
  if (rc < 0) {
    throw std::runtime_error(string("proc_listchildpids failed: ") +
                             strerror(GetErrno()));
  }
  pids.resize(std::min(size_t(rc), pids.size()));
  return pids;
}
#else
namespace {
bool isNumeric(const char *name) {
  if (*name == '\0') {
    return false;
  }
  for (const char *c = name; *c; c++) {
    if (*c < '0' || *c > '9') {
      return false;
    }
  }
  return true;
}

vector<string> listNumericEntries(const string &path) {
  vector<string> entries;
  DIR *dir = opendir(path.c_str());
  if (dir == NULL) {
    throw std::runtime_error("Cannot open " + path + ": " +
                             strerror(GetErrno()));
  }
  while (dirent *entry = readdir(dir)) {
    if (isNumeric(entry->d_name)) {
      entries.push_back(entry->d_name);
    }
  }
  closedir(dir);
  return entries;
}
}  // namespace

shared_ptr<ProcessTree> ProcessTree::createNative() {
  return shared_ptr<ProcessTree>(new ProcfsProcessTree());
}

pid_t ProcfsProcessTree::parseParentPid(const string &statContents) {
  // "<pid> (<comm>) <state> <ppid> ..."
  auto commEnd = statContents.rfind(')');
  if (commEnd == string::npos) {
    return -1;
  }
  std::istringstream fields(statContents.substr(commEnd + 1));
  string state;
  long ppid;
  if (!(fields >> state >> ppid)) {
    return -1;
  }
  return pid_t(ppid);
}

vector<pid_t> ProcfsProcessTree::childrenOf(pid_t pid) {
  auto children = childrenFromTaskFiles(pid);
  if (children) {
    return *children;
  }
  VLOG(1) << "No children files under " << procRoot << ", scanning stat files";
  return childrenFromStatScan(pid);
}

optional<vector<pid_t>> ProcfsProcessTree::childrenFromTaskFiles(pid_t pid) {
  string taskDir = procRoot + "/" + to_string(pid) + "/task";
  vector<pid_t> children;
  bool sawChildrenFile = false;
  // A child belongs to the thread that forked it, so every thread is read
  for (const auto &tid : listNumericEntries(taskDir)) {
    std::ifstream childrenFile(taskDir + "/" + tid + "/children");
    if (!childrenFile.is_open()) {
      continue;
    }
    sawChildrenFile = true;
    long child;
    while (childrenFile >> child) {
      children.push_back(pid_t(child));
    }
  }
  if (!sawChildrenFile) {
    return nullopt;
  }
  sort(children.begin(), children.end());
  children.erase(unique(children.begin(), children.end()), children.end());
  return children;
}

vector<pid_t> ProcfsProcessTree::childrenFromStatScan(pid_t pid) {
  vector<pid_t> children;
  for (const auto &entry : listNumericEntries(procRoot)) {
    std::ifstream statFile(procRoot + "/" + entry + "/stat");
    if (!statFile.is_open()) {
      // Exited while we were scanning
      continue;
    }
    string contents((std::istreambuf_iterator<char>(statFile)),
                    std::istreambuf_iterator<char>());
    if (parseParentPid(contents) == pid) {
      children.push_back(pid_t(stol(entry)));
    }
  }
  sort(children.begin(), children.end());
  return children;
}
#endif
}  // namespace wb
