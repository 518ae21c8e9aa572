#include "kubehost/remote/engine.h"

namespace kubehost::remote {

namespace {

// $1 repo dir, $2 branch, $3 ref, $4 pull. "__NONE__" marks an absent value so that
// empty strings survive the trip through ssh.
constexpr const char* kGitSyncScript = R"SH(set -euo pipefail
repo_dir="${1:?repository directory required}"
branch="${2:-__NONE__}"
ref="${3:-__NONE__}"
pull="${4:-false}"
if [[ "${branch}" == "__NONE__" ]]; then branch=""; fi
if [[ "${ref}" == "__NONE__" ]]; then ref=""; fi

cd "${repo_dir}"
git fetch --all -p

if [[ -n "${ref}" ]]; then
  echo "[remote] checkout ref: ${ref}"
  git checkout --detach "${ref}"
elif [[ -n "${branch}" ]]; then
  echo "[remote] checkout branch: ${branch}"
  if git show-ref --verify --quiet "refs/heads/${branch}"; then
    git checkout "${branch}"
  elif git show-ref --verify --quiet "refs/remotes/origin/${branch}"; then
    git checkout -b "${branch}" --track "origin/${branch}"
  else
    echo "[remote] ERROR: origin/${branch} not found" >&2
    exit 1
  fi
  git branch --set-upstream-to="origin/${branch}" "${branch}" >/dev/null 2>&1 || true
fi

if [[ "${pull}" == "true" ]]; then
  if [[ -n "${ref}" ]]; then
    echo "[remote] NOTE: pull requested with --ref ${ref}; a detached ref is not pulled, skipping pull." >&2
  elif [[ -n "${branch}" ]]; then
    echo "[remote] pull: origin ${branch} (ff-only)"
    git pull --ff-only origin "${branch}"
  else
    echo "[remote] NOTE: pull requested without a branch; skipping pull." >&2
  fi
fi
)SH";

}  // namespace

std::vector<std::string> GitSyncArguments(const std::string& repo_dir, const GitOptions& opts) {
  return {
      repo_dir,
      opts.branch.empty() ? std::string(kUnsetSentinel) : opts.branch,
      opts.ref.empty() ? std::string(kUnsetSentinel) : opts.ref,
      opts.pull ? "true" : "false",
  };
}

bool RemoteGitSync(Client& client, const std::string& repo_dir, const GitOptions& opts, std::string& error) {
  return client.ExecuteScript(kGitSyncScript, GitSyncArguments(repo_dir, opts), error);
}

}  // namespace kubehost::remote
