#include "s3_client.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <curl/curl.h>
#include <fmt/core.h>

namespace
{
    void testHttpClassification(TestReport &report)
    {
        report.section("HTTP status classification");

        report.check(S3Client::classifyError(CURLE_OK, 200) == RemoteStatus::Ok, "200 is Ok");
        report.check(S3Client::classifyError(CURLE_OK, 206) == RemoteStatus::Ok, "206 from a ranged GET is Ok");
        report.check(S3Client::classifyError(CURLE_OK, 404) == RemoteStatus::NotFound, "404 is NotFound");
        report.check(S3Client::classifyError(CURLE_OK, 403) == RemoteStatus::Forbidden, "403 is Forbidden");
        report.check(S3Client::classifyError(CURLE_OK, 401) == RemoteStatus::Forbidden, "401 is Forbidden");
        report.check(S3Client::classifyError(CURLE_OK, 408) == RemoteStatus::Transient, "408 is retried");
        report.check(S3Client::classifyError(CURLE_OK, 429) == RemoteStatus::Transient, "429 is retried");
        report.check(S3Client::classifyError(CURLE_OK, 503) == RemoteStatus::Transient, "503 is retried");
        report.check(S3Client::classifyError(CURLE_OK, 400) == RemoteStatus::Permanent, "400 is permanent");
        report.check(S3Client::classifyError(CURLE_OK, 416) == RemoteStatus::Permanent, "416 is permanent");
        report.check(S3Client::classifyError(CURLE_OK, 0) == RemoteStatus::Transient, "Missing status is retried");

        // A redirect body must never be written out as the object
        report.check(S3Client::classifyError(CURLE_OK, 301) == RemoteStatus::Permanent, "301 is not Ok");
        report.check(S3Client::classifyError(CURLE_OK, 307) == RemoteStatus::Permanent, "307 is not Ok");
        report.check(S3Client::classifyError(CURLE_OK, 304) == RemoteStatus::Permanent, "304 is not Ok");
        report.check(S3Client::classifyError(CURLE_OK, 100) == RemoteStatus::Permanent, "1xx is not Ok");
    }

    void testCurlClassification(TestReport &report)
    {
        report.section("libcurl result classification");

        report.check(S3Client::classifyError(CURLE_OPERATION_TIMEDOUT, 0) == RemoteStatus::Transient,
                     "Timeout is transient");
        report.check(S3Client::classifyError(CURLE_COULDNT_CONNECT, 0) == RemoteStatus::Transient,
                     "Refused connection is transient");
        report.check(S3Client::classifyError(CURLE_PARTIAL_FILE, 200) == RemoteStatus::Transient,
                     "Short body is transient even after a 200");
        report.check(S3Client::classifyError(CURLE_WRITE_ERROR, 200) == RemoteStatus::Permanent,
                     "Refused local write is permanent");
        report.check(S3Client::classifyError(CURLE_URL_MALFORMAT, 0) == RemoteStatus::Permanent,
                     "Malformed URL is permanent");
        report.check(S3Client::classifyError(CURLE_ABORTED_BY_CALLBACK, 206) == RemoteStatus::Cancelled,
                     "Callback abort is a cancellation");
    }

    void testAddressing(TestReport &report)
    {
        report.section("Object addressing");

        S3Client client("https://s3.amazonaws.com/", "s3://tcga-2-open/", 10);
        report.check(client.objectUrl("u1/a.bam") == "https://s3.amazonaws.com/tcga-2-open/u1/a.bam",
                     "Path-style URL without duplicated slashes");
        report.check(client.objectUrl("u 1/a b.bam") == "https://s3.amazonaws.com/tcga-2-open/u%201/a%20b.bam",
                     "Segments percent-encoded");
        report.check(client.objectUrl("u1/lanes/L#1?.bam") ==
                         "https://s3.amazonaws.com/tcga-2-open/u1/lanes/L%231%3F.bam",
                     "Separators kept, reserved characters encoded");
        report.check(client.describe("u1/a.bam") == "s3://tcga-2-open/u1/a.bam", "describe() names the bucket");

        S3Client plain("http://localhost:9000", "bucket", 10);
        report.check(plain.objectUrl("id/f.vcf.gz") == "http://localhost:9000/bucket/id/f.vcf.gz",
                     "Bare bucket name accepted");
    }

    void testStatusText(TestReport &report)
    {
        report.section("Status text");

        report.check(S3Client::getHttpStatusText(404) == "Not Found", "404 text");
        report.check(S3Client::getHttpStatusText(416) == "Range Not Satisfiable", "416 text");
        report.check(S3Client::getHttpStatusText(301) == "Moved Permanently", "301 text");
        report.check(S3Client::getHttpStatusText(599) == "Unknown Status", "Unlisted code");
    }

    void testUnreachableEndpoint(TestReport &report)
    {
        report.section("Unreachable endpoint");

        // Nothing listens on port 1; the connection is refused immediately
        ::setenv("no_proxy", "*", 1);
        S3Client client("http://127.0.0.1:1", "bucket", 5);
        client.setShowProgress(false);

        ProbeResult head = client.probe("u1/a.bam");
        report.check(head.status == RemoteStatus::Transient, "Refused HEAD is transient, not NotFound");
        report.check(!head.message.empty(), "Failure message filled in");
    }
}

int main()
{
    TestReport report("s3_client");
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int rc = 0;
    try
    {
        testHttpClassification(report);
        testCurlClassification(report);
        testAddressing(report);
        testStatusText(report);
        testUnreachableEndpoint(report);
        rc = report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}
