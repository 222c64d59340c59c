// main.cpp
#include <Arbor/Arbor.hpp>

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace Arbor;
using namespace Arbor::Html;

namespace
{
    struct Post
    {
        std::string title;
        std::string author;
        std::string body;
    };

    // Rendered once and embedded into every page.
    Expected<std::shared_ptr<const Tree::SerializedFragment>> BuildNavigation(Runtime& runtime)
    {
        Tree::ArenaLease arena   = runtime.Pool().Acquire();
        HtmlBuilder      builder = runtime.MakeBuilder(*arena);

        auto nav = builder.Nav({{"class", "site-nav"}},
                               {builder.Ul({}, {
                                                       builder.Li({}, {builder.A({{"href", "/"}}, {builder.Text("Home")})}),
                                                       builder.Li({}, {builder.A({{"href", "/archive"}}, {builder.Text("Archive")})}),
                                                       builder.Li({}, {builder.A({{"href", "/about"}}, {builder.Text("About")})}),
                                               })});
        if (!nav)
            return std::unexpected(std::move(nav.error()));
        return Preserialize(*arena, *nav);
    }

    Expected<NodeHandle> BuildPage(HtmlBuilder& builder, const Post& post,
                                   const std::shared_ptr<const Tree::SerializedFragment>& navigation)
    {
        return builder.Html({{"lang", "en"}},
                            {
                                    builder.Head({}, {
                                                             builder.Meta({{"charset", "utf-8"}}, {}),
                                                             builder.Title({}, {builder.Text(post.title)}),
                                                     }),
                                    builder.Body({}, {
                                                             builder.Header({}, {builder.PreSerialized(navigation)}),
                                                             builder.Article({{"class", "post"}},
                                                                             {
                                                                                     builder.H1({}, {builder.Text(post.title)}),
                                                                                     builder.P({{"class", "byline"}},
                                                                                               {builder.Text("by "),
                                                                                                builder.Em({}, {builder.Text(post.author)})}),
                                                                                     SoftPre(builder, post.body),
                                                                             }),
                                                     }),
                            });
    }

    // Drops the byline for the compact variant of a page.
    Expected<NodeHandle> Compact(HtmlBuilder& builder, NodeHandle page)
    {
        return Html::Map(builder, page, [](const Tree::NodeView& node, HtmlBuilder&) -> Expected<MapResult> {
            const auto cls = node.FindAttribute("class");
            if (node.HasTag("p") && cls && *cls == "byline")
                return MapResult::Remove();
            return MapResult::Keep();
        });
    }
}// namespace

int main()
{
    auto runtime = Runtime::Create(RuntimeOptions::FromEnvironment());
    if (!runtime)
    {
        std::cerr << "failed to start: " << Describe(runtime.error()) << "\n";
        return 1;
    }

    auto navigation = BuildNavigation(**runtime);
    if (!navigation)
    {
        std::cerr << "failed to build navigation: " << Describe(navigation.error()) << "\n";
        return 1;
    }

    const std::vector<Post> posts = {
            {"Arenas", "Ada", "Nodes live in a region.\n\tThey are freed together.\nSee https://example.com/arenas."},
            {"Schemas", "Grace", "Every tag knows its children.\nBad trees are rejected & reported."},
            {"Caching", "Edsger", "Render once,\nembed <everywhere>."},
            {"Sharing", "Barbara", "Subtrees are shared\nbetween versions."},
    };

    std::mutex               outputMutex;
    std::vector<std::thread> workers;
    int                      failures = 0;
    for (const Post& post: posts)
    {
        workers.emplace_back([&, post] {
            Tree::ArenaLease arena   = (*runtime)->Pool().Acquire();
            HtmlBuilder      builder = (*runtime)->MakeBuilder(*arena);

            auto page    = BuildPage(builder, post, *navigation);
            auto compact = page ? Compact(builder, *page) : page;

            std::lock_guard<std::mutex> lock(outputMutex);
            if (!compact)
            {
                std::cerr << "[" << post.title << "] " << Describe(compact.error()) << "\n";
                ++failures;
                return;
            }
            std::cout << ToHtml(*arena, *page, {.includeDoctype = true}) << "\n";
            std::cout << ToHtml(*arena, *compact) << "\n";
            std::cout << "[" << post.title << "] " << arena->Size() << " nodes\n\n";
        });
    }
    for (auto& worker: workers)
        worker.join();

    const auto& pool = (*runtime)->Pool();
    std::cout << "arenas created: " << pool.CreatedCount() << ", idle: " << pool.IdleCount() << "\n";
    return failures == 0 ? 0 : 1;
}
