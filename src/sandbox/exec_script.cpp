#include "sandbox/exec_script.hpp"
#include <fmt/core.h>
#include "common/base64.hpp"

namespace sandbox {
using namespace std;

const char *WORK_DIR = "/tmp";

const char *CODE_ENV_NAME = "RUNNER_CODE_B64";

const char *BOOTSTRAP_SOURCE = R"PY(import base64,os,shutil
payload=os.environ.get('RUNNER_CODE_B64','')
text=base64.b64decode(payload.encode('ascii')).decode('utf-8','replace') if payload else ''
path='/tmp/main.py'
try:
    with open(path,'w',encoding='utf-8') as handle:
        handle.write(text)
except Exception:
    pass
try:
    os.chdir('/tmp')
except Exception:
    pass
cwd=os.getcwd()
def _snapshot(root):
    files=set()
    for base, _, names in os.walk(root):
        for name in names:
            full=os.path.join(base,name)
            try:
                rel=os.path.relpath(full, root)
            except Exception:
                rel=name
            files.add(rel)
    return files
before=_snapshot(cwd)
globals_dict={'__name__':'__main__','__file__':path}
exec(compile(text, path, 'exec'), globals_dict)
after=_snapshot(cwd)
if cwd != '/tmp':
    for rel in sorted(after - before):
        src=os.path.join(cwd, rel)
        dst=os.path.join('/tmp', rel)
        try:
            dirpath=os.path.dirname(dst)
            if dirpath:
                os.makedirs(dirpath, exist_ok=True)
            shutil.copy2(src, dst)
        except Exception:
            pass
)PY";

exec_command build_exec_command(const string &code, const runner_config &config) {
    exec_command command;
    command.argv = {"timeout",
                    "-s", "SIGKILL",
                    fmt::format("{}s", config.timeout_sec),
                    "python",
                    "-c", BOOTSTRAP_SOURCE};
    command.env[CODE_ENV_NAME] = base64_encode(code);
    return command;
}

}  // namespace sandbox
