#include "test_common.h"
#include "prism/version.h"

using namespace prism;

static bool sat(const std::string& v, const std::string& c) {
    return check_version_constraint(v, c) == ConstraintCheck::Satisfied;
}

int main() {
    // Parsing and ordering
    auto v = Version::parse("v1.2.3");
    expect_true(v && v->release.size() == 3 && v->release[2] == 3, "leading v accepted");
    expect_true(*Version::parse("1.0") == *Version::parse("1.0.0"), "missing components compare as zero");
    expect_true(*Version::parse("1.0.0a1") < *Version::parse("1.0.0b1"), "alpha < beta");
    expect_true(*Version::parse("1.0.0-beta.2") < *Version::parse("1.0.0rc1"), "beta < rc");
    expect_true(*Version::parse("2.0rc1") < *Version::parse("2.0"), "rc < final");
    expect_true(*Version::parse("1.9.9") < *Version::parse("1.10"), "numeric component order");
    expect_true(!Version::parse("latest"), "non-version rejected");
    expect_true(!Version::parse(""), "empty rejected");
    expect_true(!Version::parse("1.0."), "trailing dot rejected");
    expect_true(!Version::parse("1.0+"), "empty local label rejected");

    // Epoch, post, dev and local segments
    expect_true(*Version::parse("2.0") < *Version::parse("1!1.0"), "epoch dominates release");
    expect_true(*Version::parse("1.0") < *Version::parse("1.0.post1"), "post sorts after final");
    expect_true(*Version::parse("1.0-1") == *Version::parse("1.0.post1"), "implicit post-release");
    expect_true(*Version::parse("1.0rev2") == *Version::parse("1.0.post2"), "rev spelling of post");
    expect_true(*Version::parse("1.0.dev1") < *Version::parse("1.0a1"), "dev sorts before pre-release");
    expect_true(*Version::parse("1.0a1.dev1") < *Version::parse("1.0a1"), "dev of a pre-release sorts before it");
    expect_true(*Version::parse("1.0.post1.dev1") < *Version::parse("1.0.post1"), "dev of a post-release sorts before it");
    expect_true(*Version::parse("1.0") < *Version::parse("1.0+abc"), "local sorts after public");
    expect_true(*Version::parse("1.0+abc") < *Version::parse("1.0+5"), "numeric local segment beats alphanumeric");
    expect_true(*Version::parse("1.0+abc.2") < *Version::parse("1.0+abc.10"), "numeric local segments by value");
    auto full = Version::parse("1!2.3rc4.post5.dev6+ubuntu.1");
    expect_true(full && full->epoch == 1 && full->pre_kind == 2 && full->pre_num == 4 && full->post == 5 &&
                    full->dev == 6 && full->local.size() == 2,
                "all segments parsed");
    expect_true(Version::parse("1.0.dev0")->is_prerelease(), "dev release is a pre-release");
    expect_true(!Version::parse("1.0.post1")->is_prerelease(), "post release is not a pre-release");

    // Comparators
    expect_true(sat("1.5.0", ">=1.0,<2.0"), "range inside");
    expect_true(!sat("2.0.0", ">=1.0,<2.0"), "range upper bound exclusive");
    expect_true(sat("1.0.0", "==1.0"), "== with padding");
    expect_true(sat("1.4.7", "==1.4.*"), "wildcard equality");
    expect_true(!sat("1.5.0", "==1.4.*"), "wildcard mismatch");
    expect_true(sat("1.5.0", "!=1.4.*"), "wildcard inequality");
    expect_true(sat("1.4.5", "~=1.4.2"), "compatible release same minor");
    expect_true(!sat("1.5.0", "~=1.4.2"), "compatible release rejects next minor");
    expect_true(sat("1.9", "~=1.4"), "compatible release two components");
    expect_true(!sat("2.0", "~=1.4"), "compatible release major bump");
    expect_true(sat("1.0.0", "===1.0.0"), "arbitrary equality");
    expect_true(!sat("1.0", "===1.0.0"), "arbitrary equality is textual");
    expect_true(sat("3.0", ">2.9,!=3.1,<=3.0"), "three clauses");
    expect_true(sat("1.0", ""), "empty constraint always satisfied");

    // Post-releases and local labels
    expect_true(sat("1.0.post1", ">=1.0"), "post-release satisfies >=");
    expect_true(sat("1.0+local", ">=1.0"), "local version satisfies >=");
    expect_true(sat("1.0+local", "==1.0"), "== ignores candidate local label");
    expect_true(!sat("1.0+a", "==1.0+b"), "== with local label is exact");
    expect_true(sat("1.0+a", "==1.0+a"), "== with matching local label");
    expect_true(!sat("1.0.post1", ">1.0"), "> excludes post-release of same version");
    expect_true(sat("1.0.post2", ">1.0.post1"), "> between post-releases");
    expect_true(!sat("1.0+local", ">1.0"), "> excludes local version of same release");
    expect_true(sat("1.1+local", ">1.0"), "> admits local version of a later release");
    expect_true(sat("1.4.5.post1", "~=1.4.2"), "compatible release admits post-release");
    expect_true(sat("1!1.0", ">=1!0.5"), "epoch in clause");
    expect_true(!sat("1!1.0", "==1.*"), "wildcard respects epoch");

    // Pre-releases only match when a clause names one
    expect_true(!sat("2.0rc1", ">=1.0"), "pre-release excluded by default");
    expect_true(!sat("1.0.dev1", ">=0.9"), "dev release excluded by default");
    expect_true(sat("2.0rc1", ">=2.0rc1"), "pre-release clause admits pre-releases");
    expect_true(sat("2.0b1", ">=1.0,<=2.0b2"), "one pre-release clause admits them for the whole set");
    expect_true(!sat("2.0a1", ">=1.0a1,<2.0"), "< excludes pre-release of its own version");
    expect_true(sat("1.5a1", ">=1.0a1,<2.0"), "< admits earlier pre-release");
    expect_true(sat("2.0rc1", "===2.0rc1"), "arbitrary equality on a pre-release");

    // Unparseable inputs are reported, not guessed
    expect_true(check_version_constraint("1.0", "~=1") == ConstraintCheck::Unparseable, "~= needs two components");
    expect_true(check_version_constraint("1.0", ">=1.*") == ConstraintCheck::Unparseable, "wildcard only with ==/!=");
    expect_true(check_version_constraint("1.0", "^1.0") == ConstraintCheck::Unparseable, "caret unsupported");
    expect_true(check_version_constraint("1.0", ">=1.0,") == ConstraintCheck::Unparseable, "dangling comma");
    expect_true(check_version_constraint("dev", ">=1.0") == ConstraintCheck::Unparseable, "bad version");
    expect_true(check_version_constraint("0.9", ">=1.0") == ConstraintCheck::Unsatisfied, "plain unsatisfied");
    expect_true(check_version_constraint("1.0", ">=1.0+local") == ConstraintCheck::Unparseable, "local only with ==/!=");
    expect_true(check_version_constraint("1.0", "==1.0rc1.*") == ConstraintCheck::Unparseable, "wildcard on pre-release");
    expect_true(check_version_constraint("1.0", "~=1.0+x") == ConstraintCheck::Unparseable, "local in compatible release");

    std::cerr << "test_version: ALL PASSED" << std::endl;
    return 0;
}
