/**
 * Resumable Upload Client Example
 *
 * This example demonstrates how to:
 * 1. Create a transfer
 * 2. Open a tus upload session for a local file
 * 3. Send the file in chunks, resuming from the server offset after a conflict
 * 4. Finalize the transfer and print its link
 */

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <Poco/Base64Encoder.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Path.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>

using namespace Poco::Net;
using namespace Poco::JSON;
using namespace std;

namespace {

string Base64(const string& value) {
    ostringstream out;
    Poco::Base64Encoder encoder(out);
    encoder.rdbuf()->setLineLength(0);
    encoder << value;
    encoder.close();
    return out.str();
}

}  // namespace

class UploadClient {
private:
    unique_ptr<HTTPClientSession> session;
    int max_attempts = 5;

    Object::Ptr readJson(istream& in) {
        stringstream body;
        Poco::StreamCopier::copyStream(in, body);
        Parser parser;
        return parser.parse(body.str()).extract<Object::Ptr>();
    }

    void addTusHeaders(HTTPRequest& request) { request.set("Tus-Resumable", "1.0.0"); }

    /**
     * Ask the server where an interrupted upload stands.
     */
    bool queryOffset(const string& upload_path, uint64_t& offset) {
        HTTPRequest request(HTTPRequest::HTTP_HEAD, upload_path, HTTPMessage::HTTP_1_1);
        addTusHeaders(request);
        session->sendRequest(request);
        HTTPResponse response;
        istream& in = session->receiveResponse(response);
        string ignored;
        Poco::StreamCopier::copyToString(in, ignored);
        if (response.getStatus() != HTTPResponse::HTTP_OK) {
            return false;
        }
        offset = stoull(response.get("Upload-Offset"));
        return true;
    }

public:
    explicit UploadClient(const string& url) {
        Poco::URI uri(url);
        if (uri.getScheme() == "https") {
            // For development, accept self-signed certificates
            Context::Ptr context = new Context(Context::CLIENT_USE, "", Context::VERIFY_NONE);
            session = make_unique<HTTPSClientSession>(uri.getHost(), uri.getPort(), context);
        } else {
            session = make_unique<HTTPClientSession>(uri.getHost(), uri.getPort());
        }
        session->setKeepAlive(true);
    }

    string createTransfer(const string& title) {
        HTTPRequest request(HTTPRequest::HTTP_POST, "/v1/transfers", HTTPMessage::HTTP_1_1);
        request.setContentType("application/json");
        Object::Ptr body = new Object;
        body->set("title", title);
        stringstream json;
        body->stringify(json);
        request.setContentLength(static_cast<std::streamsize>(json.str().size()));
        session->sendRequest(request) << json.str();

        HTTPResponse response;
        istream& in = session->receiveResponse(response);
        auto obj = readJson(in);
        if (response.getStatus() != HTTPResponse::HTTP_CREATED) {
            cout << "✗ Transfer creation failed: " << response.getReason() << endl;
            return "";
        }
        cout << "✓ Transfer created: " << obj->getValue<string>("id") << endl;
        return obj->getValue<string>("id");
    }

    string createUpload(const string& transfer_id, const string& local_path, uint64_t size) {
        HTTPRequest request(HTTPRequest::HTTP_POST, "/files", HTTPMessage::HTTP_1_1);
        addTusHeaders(request);
        request.set("Upload-Length", to_string(size));
        request.set("Upload-Metadata",
                    "transferId " + Base64(transfer_id) + ",filename " +
                        Base64(Poco::Path(local_path).getFileName()) + ",filetype " +
                        Base64("application/octet-stream"));
        request.setContentLength(0);
        session->sendRequest(request);

        HTTPResponse response;
        istream& in = session->receiveResponse(response);
        string ignored;
        Poco::StreamCopier::copyToString(in, ignored);
        if (response.getStatus() != HTTPResponse::HTTP_CREATED) {
            cout << "✗ Upload creation failed: " << response.getStatus() << " " << ignored
                 << endl;
            return "";
        }
        return Poco::URI(response.get("Location")).getPathEtc();
    }

    /**
     * Send the file in chunks. A 409 carries the server's offset; transport errors
     * fall back to a HEAD probe before retrying.
     */
    bool uploadFile(const string& upload_path, const string& local_path, uint64_t size,
                    size_t chunk_size) {
        ifstream file(local_path, ios::binary);
        if (!file.is_open()) {
            cout << "✗ Cannot open file: " << local_path << endl;
            return false;
        }
        vector<char> buffer(chunk_size);
        uint64_t offset = 0;
        int failures = 0;
        while (offset < size) {
            const auto length = static_cast<size_t>(min<uint64_t>(chunk_size, size - offset));
            file.clear();
            file.seekg(static_cast<streamoff>(offset));
            file.read(buffer.data(), static_cast<streamsize>(length));

            try {
                HTTPRequest request(HTTPRequest::HTTP_PATCH, upload_path, HTTPMessage::HTTP_1_1);
                addTusHeaders(request);
                request.setContentType("application/offset+octet-stream");
                request.set("Upload-Offset", to_string(offset));
                request.setContentLength(static_cast<std::streamsize>(length));
                session->sendRequest(request).write(buffer.data(),
                                                    static_cast<streamsize>(length));

                HTTPResponse response;
                istream& in = session->receiveResponse(response);
                string body;
                Poco::StreamCopier::copyToString(in, body);
                if (response.getStatus() == HTTPResponse::HTTP_NO_CONTENT ||
                    response.getStatus() == HTTPResponse::HTTP_CONFLICT) {
                    offset = stoull(response.get("Upload-Offset"));
                    cout << "  " << offset << " / " << size << " bytes" << endl;
                    failures = 0;
                    continue;
                }
                cout << "✗ Chunk rejected: " << response.getStatus() << " " << body << endl;
                return false;
            } catch (const Poco::Exception& e) {
                cout << "✗ Chunk error: " << e.displayText() << "; resuming" << endl;
                if (++failures >= max_attempts) {
                    return false;
                }
                session->reset();
                if (!queryOffset(upload_path, offset)) {
                    return false;
                }
            }
        }
        cout << "✓ File uploaded: " << local_path << endl;
        return true;
    }

    bool completeTransfer(const string& transfer_id) {
        HTTPRequest request(HTTPRequest::HTTP_POST, "/v1/transfers/" + transfer_id + "/complete",
                            HTTPMessage::HTTP_1_1);
        request.setContentLength(0);
        session->sendRequest(request);
        HTTPResponse response;
        istream& in = session->receiveResponse(response);
        auto obj = readJson(in);
        if (response.getStatus() != HTTPResponse::HTTP_OK) {
            cout << "✗ Completion failed: " << response.getReason() << endl;
            return false;
        }
        cout << "✓ Transfer ready: " << obj->getValue<string>("download_url") << endl;
        return true;
    }
};

int main(int argc, char* argv[]) {
    if (argc < 3) {
        cerr << "usage: " << argv[0] << " <server_url> <file> [chunk_bytes]" << endl;
        return 1;
    }
    const string server_url = argv[1];
    const string local_path = argv[2];
    const size_t chunk_size = argc > 3 ? stoul(argv[3]) : 8 * 1024 * 1024;

    try {
        ifstream probe(local_path, ios::binary | ios::ate);
        if (!probe.is_open()) {
            cerr << "✗ Cannot open file: " << local_path << endl;
            return 1;
        }
        const auto size = static_cast<uint64_t>(probe.tellg());

        UploadClient client(server_url);
        const auto transfer_id = client.createTransfer(Poco::Path(local_path).getFileName());
        if (transfer_id.empty()) {
            return 1;
        }
        const auto upload_path = client.createUpload(transfer_id, local_path, size);
        if (upload_path.empty()) {
            return 1;
        }
        if (!client.uploadFile(upload_path, local_path, size, chunk_size)) {
            return 1;
        }
        return client.completeTransfer(transfer_id) ? 0 : 1;
    } catch (const Poco::Exception& e) {
        cerr << "✗ " << e.displayText() << endl;
    } catch (const exception& e) {
        cerr << "✗ " << e.what() << endl;
    }
    return 1;
}
