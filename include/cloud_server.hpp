#pragma once
#include "html.hpp"
#include "tag_cloud.hpp"

#include <boost/beast/http.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

inline std::string renderForm()
{
    return
        "<!doctype html><html><head><meta charset='utf-8'><title>Tag Cloud</title></head><body>"
        "<h1>Tag Cloud Generator</h1>"
        "<form method='POST' action='/cloud'>"
        "<p><input type='text' name='title' placeholder='Document title' /></p>"
        "<p><input type='number' name='count' min='0' value='100' /></p>"
        "<p><textarea name='text' rows='20' cols='80' placeholder='Paste the document text'></textarea></p>"
        "<button type='submit'>Generate</button>"
        "</form>"
        "</body></html>";
}

inline std::string renderErrorPage(const std::string& title, const std::string& message)
{
    return
        "<!doctype html><html><head><meta charset='utf-8'><title>Error</title></head><body>"
        "<h1>" + htmlEscape(title) + "</h1>"
        "<p>" + htmlEscape(message) + "</p>"
        "<a href='/'>Back</a>"
        "</body></html>";
}

class CloudServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    CloudServer(const SeparatorSet& separators, const RenderOptions& options)
        : separators_(separators), options_(options)
    {
    }

    void handle(const Request& req, Response& res) const
    {
        namespace http = boost::beast::http;
        res.set(http::field::content_type, "text/html; charset=utf-8");

        try {
            if (req.method() == http::verb::get && req.target() == "/") {
                res.body() = renderForm();
            } else if (req.method() == http::verb::post && req.target() == "/cloud") {
                std::string title = extractFormField(req.body(), "title");
                std::string text = extractFormField(req.body(), "text");
                if (title.empty()) title = "untitled";

                int count = TagCloud::parseCount(extractFormField(req.body(), "count"));
                TagCloudResult cloud = TagCloud::generate(text, title, count, separators_, options_);
                res.body() = cloud.html;

                std::cout << "[Server] Rendered " << cloud.shownCount << " of "
                          << cloud.distinctWords << " words for \"" << title << "\"\n";
            } else {
                res.result(http::status::not_found);
                res.body() = "<html><body><h1>404 Not Found</h1></body></html>";
            }
        } catch (const std::invalid_argument& e) {
            res.result(http::status::bad_request);
            res.body() = renderErrorPage("Invalid request", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[Server] Error for " << req.target() << ": " << e.what() << "\n";
            res.result(http::status::internal_server_error);
            res.body() = renderErrorPage("Internal server error", "The tag cloud could not be generated.");
        }
    }

private:
    SeparatorSet separators_;
    RenderOptions options_;
};
