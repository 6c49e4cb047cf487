#include "sandbox/bootstrap.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <nlohmann/json.hpp>
#include <set>

namespace grader {
using namespace std;
using namespace nlohmann;

const vector<string> &baseline_modules() {
    static const vector<string> modules = {
        "abc", "array", "bisect", "calendar", "cmath", "collections", "copy",
        "dataclasses", "datetime", "decimal", "enum", "fractions", "functools",
        "heapq", "itertools", "json", "math", "numbers", "operator", "pprint",
        "random", "re", "statistics", "string", "sys", "textwrap", "time",
        "typing", "unicodedata"};
    return modules;
}

static const char *bootstrap_template = R"py(import sys


def _load_main():
    with open("main.py", "rb") as source:
        return compile(source.read(), "main.py", "exec")


def _install_guards(scratch, permitted):
    import builtins
    import os

    scratch = os.path.realpath(scratch)
    write_flags = os.O_WRONLY | os.O_RDWR | os.O_CREAT | os.O_APPEND | os.O_TRUNC
    path_events = {
        "os.chflags": (0,),
        "os.chmod": (0,),
        "os.chown": (0,),
        "os.link": (0, 1),
        "os.mkdir": (0,),
        "os.remove": (0,),
        "os.removexattr": (0,),
        "os.rename": (0, 1),
        "os.rmdir": (0,),
        "os.setxattr": (0,),
        "os.symlink": (1,),
        "os.truncate": (0,),
        "os.utime": (0,),
        "shutil.rmtree": (0,),
    }
    denied_events = frozenset((
        "os.exec", "os.fork", "os.forkpty", "os.kill", "os.killpg",
        "os.posix_spawn", "os.spawn", "os.system", "pty.spawn",
        "subprocess.Popen", "sys.remote_exec",
    ))
    denied_prefixes = ("socket.", "ctypes.")
    denied_imports = frozenset(("_ctypes", "_posixsubprocess", "_socket"))
    active = [False]

    def inside(path):
        if isinstance(path, int):
            return True
        try:
            full = os.path.realpath(os.fsdecode(path))
        except (TypeError, ValueError):
            return False
        return full == scratch or full.startswith(scratch + os.sep)

    def deny(event, target):
        raise PermissionError(13, "Operation not permitted in sandbox: " + event, target)

    def audit(event, args):
        if active[0]:
            return
        active[0] = True
        try:
            if event == "open":
                flags = args[2] if len(args) > 2 else 0
                if isinstance(flags, int) and flags & write_flags and not inside(args[0]):
                    deny(event, args[0])
            elif event in path_events:
                for index in path_events[event]:
                    if index < len(args) and not inside(args[index]):
                        deny(event, args[index])
            elif event == "import":
                if args[0] in denied_imports:
                    raise ImportError("import of '%s' is not allowed" % args[0], name=args[0])
            elif event in denied_events or event.startswith(denied_prefixes):
                deny(event, None)
        finally:
            active[0] = False

    original_import = builtins.__import__

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        try:
            caller = sys._getframe(1).f_globals
        except ValueError:
            caller = {}
        if level == 0 and caller.get("__name__") == "__main__":
            root = name.partition(".")[0]
            if root not in permitted:
                raise ImportError("import of '%s' is not allowed" % name, name=name)
        return original_import(name, globals, locals, fromlist, level)

    builtins.__import__ = guarded_import
    sys.addaudithook(audit)

    if "os" not in permitted:
        sys.modules.pop("os", None)


_code = _load_main()
_install_guards(@SCRATCH@, frozenset(@PERMITTED@))
del _load_main, _install_guards
sys.argv = ["main.py"]
exec(_code, {"__name__": "__main__", "__builtins__": __builtins__, "__file__": "main.py"})
)py";

string make_bootstrap(const filesystem::path &scratch, const vector<string> &allowed_modules) {
    set<string> permitted(baseline_modules().begin(), baseline_modules().end());
    permitted.insert(allowed_modules.begin(), allowed_modules.end());

    // JSON 的字符串和数组字面量同时也是合法的 Python 字面量
    string script = bootstrap_template;
    boost::algorithm::replace_all(script, "@SCRATCH@", json(scratch.string()).dump());
    boost::algorithm::replace_all(script, "@PERMITTED@", json(permitted).dump());
    return script;
}

}  // namespace grader
