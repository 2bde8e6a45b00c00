#include "wxdown/core/server/PathSandbox.h"
#include "wxdown/core/server/FileSession.h"
#include "wxdown/core/http/MimeTypes.h"
#include "TestSupport.h"
#include <cassert>
#include <string>

using namespace wxdown::core::server;
using wxdown::core::http::mime_type_for;
using wxdown::core::http::kDefaultMimeType;
using namespace wxdown_test;

int main() {
    const fs::path root = "/srv/site";

    // Plain targets map below root
    {
        auto p = resolve_in_root(root, "/a/b.html");
        assert(p && *p == fs::path("/srv/site/a/b.html"));
        auto q = resolve_in_root(root, "/a/b.html?x=1#frag");
        assert(q && *q == fs::path("/srv/site/a/b.html"));
        auto d = resolve_in_root(root, "/a/./c/../b.html");
        assert(d && *d == fs::path("/srv/site/a/b.html"));
        auto s = resolve_in_root(root, "/my%20page.html");
        assert(s && *s == fs::path("/srv/site/my page.html"));
        auto abs = resolve_in_root(root, "http://127.0.0.1:8080/x.css");
        assert(abs && *abs == fs::path("/srv/site/x.css"));
        // Leading slashes never make the path absolute
        auto dbl = resolve_in_root(root, "//etc/passwd");
        assert(dbl && *dbl == fs::path("/srv/site/etc/passwd"));
    }

    // Everything that leaves root is refused
    {
        assert(!resolve_in_root(root, "/../etc/passwd"));
        assert(!resolve_in_root(root, "/a/../../etc/passwd"));
        assert(!resolve_in_root(root, "/%2e%2e/etc/passwd"));
        assert(!resolve_in_root(root, "/%2E%2E%2Fetc%2Fpasswd"));
        assert(!resolve_in_root(root, "/..%2F..%2Fetc"));
        assert(!resolve_in_root(root, "/../site-other/x"));
        assert(!resolve_in_root(root, "/a%zz"));
        assert(!resolve_in_root(root, "/a%2"));
        assert(!resolve_in_root(root, "/x.html%00.png"));
    }

    // Containment is component-wise
    {
        assert(is_within("/srv/a", "/srv/a"));
        assert(is_within("/srv/a", "/srv/a/b/c"));
        assert(!is_within("/srv/a", "/srv/ab"));
        assert(!is_within("/srv/a", "/srv"));
        assert(!is_within("/srv/a", "/other/a"));
        // Root spelled with a trailing separator
        assert(is_within("/srv/a/", "/srv/a/b"));
        assert(is_within("/srv/a/", "/srv/a"));
        assert(!is_within("/srv/a/", "/srv/ab"));
        assert(!is_within("/srv/a/", "/srv"));
        assert(!is_within("/srv/a/", "/srv/a/../b"));
        auto from_slashed = resolve_in_root("/srv/site/", "/css/app.css");
        assert(from_slashed && *from_slashed == fs::path("/srv/site/css/app.css"));
    }

    // MIME table
    {
        assert(mime_type_for("x/index.html") == "text/html");
        assert(mime_type_for("app.JS") == "text/javascript");
        assert(mime_type_for("s.css") == "text/css");
        assert(mime_type_for("d.json") == "application/json");
        assert(mime_type_for("i.png") == "image/png");
        assert(mime_type_for("i.jpg") == "image/jpg");
        assert(mime_type_for("i.svg") == "application/image/svg+xml");
        assert(mime_type_for("f.woff") == "application/font-woff");
        assert(mime_type_for("archive.tar.gz") == kDefaultMimeType);
        assert(mime_type_for("README") == kDefaultMimeType);
    }

    // respond_to against a real tree, symlink escape included
    {
        TempDir dir("sandbox");
        fs::path site = fs::canonical(dir.path) / "site";
        fs::create_directories(site / "sub");
        fs::create_directories(dir.path / "outside");
        write_text(site / "index.html", "<p>home</p>");
        write_text(site / "sub" / "index.html", "<p>sub</p>");
        write_text(site / "style.css", "body{}");
        write_text(dir.path / "outside" / "secret.txt", "secret");
        fs::create_directory_symlink(dir.path / "outside", site / "escape");

        auto ok = respond_to(site, "/style.css");
        assert(ok.status == 200 && ok.body == "body{}" && ok.contentType == "text/css");
        auto index = respond_to(site, "/");
        assert(index.status == 200 && index.body == "<p>home</p>");
        auto sub = respond_to(site, "/sub");
        assert(sub.status == 200 && sub.body == "<p>sub</p>");
        assert(respond_to(site, "/missing.png").status == 404);
        assert(respond_to(site, "/../outside/secret.txt").status == 403);
        auto esc = respond_to(site, "/escape/secret.txt");
        assert(esc.status == 403);
        assert(esc.body.find("secret") == std::string::npos);
        // A directory without index.html
        fs::create_directories(site / "empty");
        assert(respond_to(site, "/empty/").status == 404);
    }

    // Read failures other than a missing file give 500 with the error name
    {
        TempDir dir("sandbox_errors");
        fs::path site = fs::canonical(dir.path);
        write_text(site / "style.css", "body{}");
        fs::create_directories(site / "odd" / "index.html");
        write_text(site / "locked.html", "<p>locked</p>");

        auto notdir = respond_to(site, "/style.css/x");
        assert(notdir.status == 500);
        assert(notdir.contentType == "text/plain");
        assert(notdir.body.find("ENOTDIR") != std::string::npos);

        auto isdir = respond_to(site, "/odd/");
        assert(isdir.status == 500);
        assert(isdir.body.find("EISDIR") != std::string::npos);

        // root reads through the permission bits
        if (::geteuid() != 0) {
            fs::permissions(site / "locked.html", fs::perms::none);
            auto denied = respond_to(site, "/locked.html");
            assert(denied.status == 500);
            assert(denied.body.find("EACCES") != std::string::npos);
            assert(denied.body.find("locked") == std::string::npos);
            fs::permissions(site / "locked.html", fs::perms::owner_read | fs::perms::owner_write);
        }
    }
    return 0;
}
