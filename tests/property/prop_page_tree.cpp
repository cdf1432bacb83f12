#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/page_tree.hpp"
#include "core/slug.hpp"

#include <algorithm>
#include <set>

using namespace folio;

namespace {

enum class OpKind { Create, Move, Remove, Rename };

struct TreeOp {
    OpKind kind;
    std::size_t subject;  // index into the live ids
    std::size_t target;   // index into the live ids
    int position;
    std::string title;
};

void check_node(const PageTree& tree, const PageNode& node, std::set<PageId>& seen) {
    RC_ASSERT(seen.insert(node.view.page.id).second);
    RC_ASSERT(tree.path_of(node.view.page.id).unwrap() == node.view.path);
    RC_ASSERT(tree.get_by_path(node.view.path).unwrap().page.id == node.view.page.id);
    RC_ASSERT(node.view.has_children == !node.children.empty());

    std::set<std::string> slugs;
    for (std::size_t i = 0; i < node.children.size(); ++i) {
        const auto& child = node.children[i].view.page;
        RC_ASSERT(child.parent_id == std::optional<PageId>(node.view.page.id));
        RC_ASSERT(child.position == static_cast<int>(i));
        RC_ASSERT(slug::is_valid(child.slug));
        RC_ASSERT(slugs.insert(child.slug).second);
        check_node(tree, node.children[i], seen);
    }
}

void check_invariants(const PageTree& tree) {
    auto root = tree.get(PageTree::ROOT_ID);
    RC_ASSERT(root.is_ok());
    RC_ASSERT(root.unwrap().page.is_root());
    RC_ASSERT(root.unwrap().path == "/");

    // Every page is reachable from the root exactly once: no cycles, no orphans.
    std::set<PageId> seen;
    check_node(tree, tree.list_tree(), seen);
    RC_ASSERT(seen.size() == tree.size());
}

} // namespace

namespace rc {

template<>
struct Arbitrary<TreeOp> {
    static Gen<TreeOp> arbitrary() {
        return gen::build<TreeOp>(
            gen::set(&TreeOp::kind, gen::element(OpKind::Create, OpKind::Create, OpKind::Move,
                                                 OpKind::Remove, OpKind::Rename)),
            gen::set(&TreeOp::subject, gen::inRange<std::size_t>(0, 64)),
            gen::set(&TreeOp::target, gen::inRange<std::size_t>(0, 64)),
            gen::set(&TreeOp::position, gen::inRange(-2, 8)),
            gen::set(&TreeOp::title, gen::element(std::string("Home"), std::string("About"),
                                                  std::string("about"), std::string("News!"),
                                                  std::string(), std::string("A b c"))));
    }
};

} // namespace rc

TEST_CASE("Property: random edits keep the tree consistent", "[property][page_tree]") {
    rc::check("create/move/remove/rename sequences preserve the tree invariants",
        [](const std::vector<TreeOp>& ops) {
            PageTree tree;
            std::vector<PageId> live{PageTree::ROOT_ID};

            for (const auto& op : ops) {
                const PageId subject = live[op.subject % live.size()];
                const PageId target = live[op.target % live.size()];
                const auto before = tree.list_tree();

                switch (op.kind) {
                case OpKind::Create: {
                    auto created = tree.create(NewPage{.parent_id = target, .title = op.title,
                                                       .position = op.position});
                    RC_ASSERT(created.is_ok());
                    live.push_back(created.unwrap().page.id);
                    break;
                }
                case OpKind::Move: {
                    const bool allowed = subject != PageTree::ROOT_ID &&
                                         subject != target &&
                                         !tree.is_ancestor(subject, target);
                    auto moved = tree.move(subject, target, op.position);
                    if (!allowed) {
                        RC_ASSERT(moved.is_err());
                    } else if (moved.is_err()) {
                        RC_ASSERT(moved.unwrap_err().kind == ErrorKind::SlugConflict);
                    }
                    if (moved.is_err()) {
                        RC_ASSERT(tree.list_tree() == before);
                    } else {
                        RC_ASSERT(moved.unwrap().page.parent_id == std::optional<PageId>(target));
                    }
                    break;
                }
                case OpKind::Remove: {
                    auto removed = tree.remove(subject);
                    if (subject == PageTree::ROOT_ID) {
                        RC_ASSERT(removed.unwrap_err().kind == ErrorKind::InvalidOperation);
                        RC_ASSERT(tree.list_tree() == before);
                        break;
                    }
                    RC_ASSERT(removed.is_ok());
                    const auto& ids = removed.unwrap();
                    RC_ASSERT(ids.front() == subject);
                    std::erase_if(live, [&](PageId id) {
                        return std::find(ids.begin(), ids.end(), id) != ids.end();
                    });
                    for (auto id : ids) {
                        RC_ASSERT(!tree.contains(id));
                    }
                    break;
                }
                case OpKind::Rename: {
                    auto updated = tree.update(subject, PagePatch{.title = op.title});
                    RC_ASSERT(updated.is_ok());
                    break;
                }
                }

                check_invariants(tree);
            }
        }
    );
}
